
#include "monitor.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

std::chrono::steady_clock::duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

} // namespace

Monitor::TargetCell::TargetCell(const Target& t, const Settings& settings)
    : target(t),
      health(t, settings.max_consecutive_failures,
             std::chrono::minutes(settings.health_check_window_minutes)) {
}

Monitor::Monitor(const Config& config, Collaborators collaborators, std::ostream& out)
    : config_(config),
      prober_(collaborators.transport, collaborators.cert_inspector),
      alert_evaluator_(config.alerts, collaborators.webhook_sink),
      reporter_(config.settings, out) {
    if (!collaborators.transport) {
        throw std::invalid_argument("Monitor requires an HTTP transport");
    }

    for (const auto& target : config_.targets) {
        cells_.push_back(std::make_unique<TargetCell>(target, config_.settings));
    }
}

Monitor::~Monitor() {
    stop();
}

void Monitor::run() {
    if (started_.exchange(true)) {
        throw std::logic_error("Monitor::run may only be called once");
    }

    spdlog::info("Starting HTTP monitor for {} targets...", cells_.size());

    std::vector<std::thread> threads;
    try {
        for (auto& cell : cells_) {
            threads.emplace_back(&Monitor::poll_loop, this, std::ref(*cell));
        }
        threads.emplace_back(&Monitor::summary_loop, this);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start monitor threads: {}", e.what());
        token_.cancel();
        for (auto& thread : threads) {
            thread.join();
        }
        throw;
    }

    for (auto& thread : threads) {
        thread.join();
    }

    spdlog::info("All poll loops stopped.");
    reporter_.print_final_summary(snapshot_all());
}

void Monitor::stop() {
    if (!token_.is_cancelled()) {
        spdlog::info("Stopping monitor...");
        token_.cancel();
    }
}

void Monitor::poll_loop(TargetCell& cell) {
    const auto interval = seconds_to_duration(cell.target.interval_seconds);
    spdlog::debug("Poll loop for {} started (every {:.1f}s)", cell.target.name, cell.target.interval_seconds);

    while (!token_.is_cancelled()) {
        auto start = std::chrono::steady_clock::now();

        try {
            run_iteration(cell);
        } catch (const std::exception& e) {
            // Keep this target on schedule; other targets are unaffected
            spdlog::error("Poll loop for {} hit an error: {}", cell.target.name, e.what());
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed < interval) {
            if (token_.wait_for(interval - elapsed)) {
                break;
            }
        }
    }

    spdlog::debug("Poll loop for {} stopped", cell.target.name);
}

void Monitor::run_iteration(TargetCell& cell) {
    auto check = prober_.probe(cell.target);

    TargetHealthSnapshot snapshot;
    HealthStatus previous;
    {
        std::lock_guard<std::mutex> lock(cell.mutex);
        previous = cell.health.current_status();
        cell.health.update_with_check(check);
        snapshot = cell.health.snapshot(check.timestamp);
    }

    if (previous != snapshot.current_status && previous != HealthStatus::Unknown) {
        if (snapshot.current_status == HealthStatus::Unhealthy) {
            spdlog::warn("{} is now {} ({} consecutive failures)", cell.target.name,
                         health_status_to_string(snapshot.current_status), snapshot.consecutive_failures);
        } else {
            spdlog::info("{} changed from {} to {}", cell.target.name,
                         health_status_to_string(previous), health_status_to_string(snapshot.current_status));
        }
    }

    if (!check.success) {
        spdlog::warn("Check for {} failed: {}", cell.target.name, check.error.value_or(
            check.status_code ? "unexpected status " + std::to_string(*check.status_code) : "unknown error"));
    }

    alert_evaluator_.evaluate(cell.target, check, snapshot);
    reporter_.print_check_result(cell.target, check);
}

void Monitor::summary_loop() {
    const auto interval = std::chrono::seconds(config_.settings.summary_interval_seconds);
    while (!token_.wait_for(interval)) {
        reporter_.print_summary(snapshot_all());
    }
}

std::vector<TargetHealthSnapshot> Monitor::snapshot_all() const {
    std::vector<TargetHealthSnapshot> snapshots;
    snapshots.reserve(cells_.size());

    auto now = std::chrono::system_clock::now();
    for (const auto& cell : cells_) {
        std::lock_guard<std::mutex> lock(cell->mutex);
        snapshots.push_back(cell->health.snapshot(now));
    }
    return snapshots;
}

std::optional<TargetHealthSnapshot> Monitor::snapshot(const std::string& target_name) const {
    for (const auto& cell : cells_) {
        if (cell->target.name == target_name) {
            std::lock_guard<std::mutex> lock(cell->mutex);
            return cell->health.snapshot();
        }
    }
    return std::nullopt;
}
