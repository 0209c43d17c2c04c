
#pragma once

#include "target_health.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

class StatusServer {
public:
    using SnapshotProvider = std::function<std::vector<TargetHealthSnapshot>()>;

    StatusServer(const std::string& host, int port, SnapshotProvider provider);
    ~StatusServer();

    void start();
    void stop();
    bool is_running() const;

    // Non-copyable
    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
