
#include "reporter.hpp"
#include "util.hpp"
#include <fmt/color.h>
#include <fmt/format.h>
#include <algorithm>
#include <optional>
#include <sstream>

namespace {

void sort_by_name(std::vector<TargetHealthSnapshot>& snapshots) {
    std::sort(snapshots.begin(), snapshots.end(),
              [](const TargetHealthSnapshot& a, const TargetHealthSnapshot& b) { return a.name < b.name; });
}

std::string status_label(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "Healthy";
        case HealthStatus::Degraded: return "Degraded";
        case HealthStatus::Unhealthy: return "Unhealthy";
        case HealthStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string prometheus_label(const std::string& value) {
    std::string escaped;
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"': escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

} // namespace

Reporter::Reporter(const Settings& settings, std::ostream& out)
    : format_(settings.output_format), colors_(settings.enable_colors), out_(out) {
}

void Reporter::print_check_result(const Target& target, const HealthCheck& check) {
    auto line = render_check(target, check);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line << std::flush;
}

void Reporter::print_summary(std::vector<TargetHealthSnapshot> snapshots) {
    auto text = render_summary(std::move(snapshots));
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (format_ == OutputFormat::Pretty) {
        out_ << "\n📊 Status Summary:\n";
    }
    out_ << text << std::flush;
}

void Reporter::print_final_summary(std::vector<TargetHealthSnapshot> snapshots) {
    auto text = render_summary(std::move(snapshots));
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (format_ == OutputFormat::Pretty) {
        out_ << "\n🏁 Final Summary:\n";
    }
    out_ << text << std::flush;
}

std::string Reporter::render_check(const Target& target, const HealthCheck& check) const {
    if (format_ == OutputFormat::Json) {
        return check.to_json().dump() + "\n";
    }
    if (format_ == OutputFormat::Csv || format_ == OutputFormat::Prometheus) {
        // Machine formats only carry summaries
        return "";
    }

    std::string mark = check.success ? "✓" : "✗";
    if (colors_) {
        mark = fmt::format(fmt::fg(check.success ? fmt::terminal_color::green : fmt::terminal_color::red), "{}", mark);
    }
    std::string name = colors_ ? fmt::format(fmt::emphasis::bold, "{}", target.name) : target.name;

    std::string line = fmt::format("[{}] {} {} | {} | {}\n",
                                   util::format_clock_time(check.timestamp),
                                   mark,
                                   name,
                                   paint_code(check.status_code),
                                   paint_time(check.response_time));

    if (check.error) {
        std::string error = colors_ ? fmt::format(fmt::fg(fmt::terminal_color::red), "{}", *check.error) : *check.error;
        line += fmt::format("    Error: {}\n", error);
    }
    return line;
}

std::string Reporter::render_summary(std::vector<TargetHealthSnapshot> snapshots) const {
    sort_by_name(snapshots);

    switch (format_) {
        case OutputFormat::Json:
            return summary_json(snapshots).dump() + "\n";
        case OutputFormat::Csv:
            return render_csv(snapshots);
        case OutputFormat::Prometheus:
            return render_prometheus(snapshots);
        case OutputFormat::Pretty:
            break;
    }
    return render_table(snapshots);
}

nlohmann::json Reporter::summary_json(const std::vector<TargetHealthSnapshot>& snapshots,
                                      std::chrono::system_clock::time_point now) {
    nlohmann::json j;
    j["timestamp"] = util::format_iso8601(now);
    j["targets"] = nlohmann::json::array();
    for (const auto& snap : snapshots) {
        j["targets"].push_back(snap.to_json());
    }
    return j;
}

std::string Reporter::render_table(const std::vector<TargetHealthSnapshot>& snapshots) const {
    std::ostringstream ss;
    ss << fmt::format("{:<20} {:<10} {:<10} {:<15} {:<10}\n", "Target", "Status", "Uptime", "Avg Response", "Health");

    std::string rule;
    for (int i = 0; i < 75; ++i) rule += "─";
    ss << rule << "\n";

    for (const auto& snap : snapshots) {
        ss << fmt::format("{:<20} {} {:<9.1f}% {:<13.0f}ms {:<10.1f}\n",
                          snap.name,
                          paint_status(snap.current_status, fmt::format("{:<10}", status_label(snap.current_status))),
                          snap.uptime_percentage,
                          snap.avg_response_ms,
                          snap.health_score * 100.0);
    }
    ss << "\n";
    return ss.str();
}

std::string Reporter::render_csv(const std::vector<TargetHealthSnapshot>& snapshots) {
    std::ostringstream ss;
    ss << "target,status,uptime_percentage,avg_response_ms,health_score,total_checks,successful_checks,consecutive_failures\n";
    for (const auto& snap : snapshots) {
        ss << fmt::format("{},{},{:.2f},{:.1f},{:.3f},{},{},{}\n",
                          csv_field(snap.name),
                          health_status_to_string(snap.current_status),
                          snap.uptime_percentage,
                          snap.avg_response_ms,
                          snap.health_score,
                          snap.total_checks,
                          snap.successful_checks,
                          snap.consecutive_failures);
    }
    return ss.str();
}

std::string Reporter::render_prometheus(const std::vector<TargetHealthSnapshot>& snapshots) {
    struct Gauge {
        const char* name;
        const char* help;
        std::optional<double> (*value)(const TargetHealthSnapshot&);
    };

    static const Gauge gauges[] = {
        {"httpmon_up", "Whether the most recent check succeeded (1) or failed (0).",
         [](const TargetHealthSnapshot& s) -> std::optional<double> {
             return (s.total_checks > 0 && s.consecutive_failures == 0) ? 1.0 : 0.0;
         }},
        {"httpmon_uptime_percentage", "Share of successful checks since start.",
         [](const TargetHealthSnapshot& s) -> std::optional<double> { return s.uptime_percentage; }},
        {"httpmon_window_uptime_percentage", "Share of successful checks within the health window.",
         [](const TargetHealthSnapshot& s) -> std::optional<double> { return s.window_uptime_percentage; }},
        {"httpmon_response_time_ms_avg", "Mean response time in milliseconds.",
         [](const TargetHealthSnapshot& s) -> std::optional<double> { return s.avg_response_ms; }},
        {"httpmon_health_score", "Composite health score between 0 and 1.",
         [](const TargetHealthSnapshot& s) -> std::optional<double> { return s.health_score; }},
        {"httpmon_checks_total", "Number of checks performed.",
         [](const TargetHealthSnapshot& s) -> std::optional<double> { return static_cast<double>(s.total_checks); }},
    };

    std::ostringstream ss;
    for (const auto& gauge : gauges) {
        ss << "# HELP " << gauge.name << " " << gauge.help << "\n";
        ss << "# TYPE " << gauge.name << " gauge\n";
        for (const auto& snap : snapshots) {
            auto value = gauge.value(snap);
            if (!value) {
                continue;
            }
            ss << fmt::format("{}{{target=\"{}\",url=\"{}\"}} {}\n",
                              gauge.name,
                              prometheus_label(snap.name),
                              prometheus_label(snap.url),
                              *value);
        }
    }
    return ss.str();
}

std::string Reporter::paint_status(HealthStatus status, const std::string& text) const {
    if (!colors_) {
        return text;
    }
    switch (status) {
        case HealthStatus::Healthy:
            return fmt::format(fmt::fg(fmt::terminal_color::green), "{}", text);
        case HealthStatus::Degraded:
            return fmt::format(fmt::fg(fmt::terminal_color::yellow), "{}", text);
        case HealthStatus::Unhealthy:
            return fmt::format(fmt::fg(fmt::terminal_color::red), "{}", text);
        case HealthStatus::Unknown:
            break;
    }
    return fmt::format(fmt::fg(fmt::terminal_color::white), "{}", text);
}

std::string Reporter::paint_code(const std::optional<int>& status_code) const {
    if (!status_code) {
        return colors_ ? fmt::format(fmt::fg(fmt::terminal_color::red), "ERROR") : "ERROR";
    }

    std::string text = std::to_string(*status_code);
    if (!colors_) {
        return text;
    }
    if (*status_code >= 200 && *status_code < 300) {
        return fmt::format(fmt::fg(fmt::terminal_color::green), "{}", text);
    }
    if (*status_code >= 300 && *status_code < 400) {
        return fmt::format(fmt::fg(fmt::terminal_color::yellow), "{}", text);
    }
    return fmt::format(fmt::fg(fmt::terminal_color::red), "{}", text);
}

std::string Reporter::paint_time(std::chrono::milliseconds elapsed) const {
    std::string text = fmt::format("{}ms", elapsed.count());
    if (!colors_) {
        return text;
    }
    if (elapsed.count() <= 200) {
        return fmt::format(fmt::fg(fmt::terminal_color::green), "{}", text);
    }
    if (elapsed.count() <= 1000) {
        return fmt::format(fmt::fg(fmt::terminal_color::yellow), "{}", text);
    }
    return fmt::format(fmt::fg(fmt::terminal_color::red), "{}", text);
}
