
#pragma once

#include "http_transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

class WebhookSink {
public:
    virtual ~WebhookSink() = default;

    // Hands off a notification. Must return without waiting on the network.
    virtual void dispatch(const std::string& url, const nlohmann::json& payload) = 0;
};

// Posts notifications from a background thread. Delivery failures are logged
// at debug and dropped: no retry, no escalation. stop() keeps delivering for at
// most drain_timeout; whatever is still queued then is counted as failed.
class WebhookDispatcher : public WebhookSink {
public:
    explicit WebhookDispatcher(std::shared_ptr<HttpTransport> transport,
                               std::chrono::milliseconds timeout = std::chrono::seconds(10),
                               std::size_t max_pending = 1000,
                               std::chrono::milliseconds drain_timeout = std::chrono::seconds(5));
    ~WebhookDispatcher() override;

    void start();
    // Delivers what is already queued within the drain deadline, then joins the worker
    void stop();

    void dispatch(const std::string& url, const nlohmann::json& payload) override;

    std::size_t delivered_count() const { return delivered_; }
    std::size_t failed_count() const { return failed_; }

    // Non-copyable
    WebhookDispatcher(const WebhookDispatcher&) = delete;
    WebhookDispatcher& operator=(const WebhookDispatcher&) = delete;

private:
    struct Pending {
        std::string url;
        std::string body;
    };

    void worker_loop();
    void deliver(const Pending& item, std::chrono::milliseconds timeout);

    std::shared_ptr<HttpTransport> transport_;
    std::chrono::milliseconds timeout_;
    std::size_t max_pending_;
    std::chrono::milliseconds drain_timeout_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Pending> queue_;
    std::chrono::steady_clock::time_point drain_deadline_;

    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
};
