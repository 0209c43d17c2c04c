
#pragma once

#include "config.hpp"
#include "target_health.hpp"
#include "types.hpp"
#include <chrono>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Renders check results and status summaries. All writes to the output
// stream are serialized, so poll loops and the summary thread may share it.
class Reporter {
public:
    explicit Reporter(const Settings& settings, std::ostream& out = std::cout);

    void print_check_result(const Target& target, const HealthCheck& check);
    void print_summary(std::vector<TargetHealthSnapshot> snapshots);
    void print_final_summary(std::vector<TargetHealthSnapshot> snapshots);

    std::string render_check(const Target& target, const HealthCheck& check) const;
    std::string render_summary(std::vector<TargetHealthSnapshot> snapshots) const;

    static nlohmann::json summary_json(const std::vector<TargetHealthSnapshot>& snapshots,
                                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    std::string render_table(const std::vector<TargetHealthSnapshot>& snapshots) const;
    static std::string render_csv(const std::vector<TargetHealthSnapshot>& snapshots);
    static std::string render_prometheus(const std::vector<TargetHealthSnapshot>& snapshots);

private:
    std::string paint_status(HealthStatus status, const std::string& text) const;
    std::string paint_code(const std::optional<int>& status_code) const;
    std::string paint_time(std::chrono::milliseconds elapsed) const;

    OutputFormat format_;
    bool colors_;
    std::ostream& out_;
    std::mutex out_mutex_;
};
