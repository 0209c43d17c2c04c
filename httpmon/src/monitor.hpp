
#pragma once

#include "alert_evaluator.hpp"
#include "cancellation_token.hpp"
#include "cert_inspector.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "prober.hpp"
#include "reporter.hpp"
#include "target_health.hpp"
#include "webhook_dispatcher.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

class Monitor {
public:
    struct Collaborators {
        std::shared_ptr<HttpTransport> transport;
        std::shared_ptr<CertInspector> cert_inspector;
        std::shared_ptr<WebhookSink> webhook_sink;
    };

    Monitor(const Config& config, Collaborators collaborators, std::ostream& out = std::cout);
    ~Monitor();

    // Runs one poll loop per target plus the summary loop, blocks until
    // stop() is called and every loop has exited, then prints the final summary.
    void run();
    void stop();

    bool is_stopping() const { return token_.is_cancelled(); }

    std::vector<TargetHealthSnapshot> snapshot_all() const;
    std::optional<TargetHealthSnapshot> snapshot(const std::string& target_name) const;

    // Non-copyable
    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

private:
    // State owned by one target's poll loop; readers only take a copy
    struct TargetCell {
        TargetCell(const Target& t, const Settings& settings);

        Target target;
        mutable std::mutex mutex;
        TargetHealth health;
    };

    void poll_loop(TargetCell& cell);
    void run_iteration(TargetCell& cell);
    void summary_loop();

    Config config_;
    std::vector<std::unique_ptr<TargetCell>> cells_;
    Prober prober_;
    AlertEvaluator alert_evaluator_;
    Reporter reporter_;
    CancellationToken token_;
    std::atomic<bool> started_{false};
};
