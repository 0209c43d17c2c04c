
#include "webhook_dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

WebhookDispatcher::WebhookDispatcher(std::shared_ptr<HttpTransport> transport,
                                     std::chrono::milliseconds timeout,
                                     std::size_t max_pending,
                                     std::chrono::milliseconds drain_timeout)
    : transport_(std::move(transport)), timeout_(timeout), max_pending_(max_pending),
      drain_timeout_(drain_timeout) {
}

WebhookDispatcher::~WebhookDispatcher() {
    stop();
}

void WebhookDispatcher::start() {
    if (running_.exchange(true)) return;
    worker_thread_ = std::thread(&WebhookDispatcher::worker_loop, this);
    spdlog::debug("Webhook dispatcher started.");
}

void WebhookDispatcher::stop() {
    {
        // Deadline and flag change together under the lock the worker reads them with
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return;
        drain_deadline_ = std::chrono::steady_clock::now() + drain_timeout_;
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    spdlog::debug("Webhook dispatcher stopped ({} delivered, {} failed).",
                  delivered_.load(), failed_.load());
}

void WebhookDispatcher::dispatch(const std::string& url, const nlohmann::json& payload) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= max_pending_) {
            queue_.pop();
            failed_++;
            spdlog::debug("Webhook queue full, dropped the oldest notification.");
        }
        queue_.push({url, payload.dump()});
    }
    queue_cv_.notify_one();
}

void WebhookDispatcher::worker_loop() {
    while (true) {
        Pending item;
        auto timeout = timeout_;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) {
                // Only reached once stopped with nothing left to send
                break;
            }
            if (!running_) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    drain_deadline_ - std::chrono::steady_clock::now());
                if (remaining <= std::chrono::milliseconds::zero()) {
                    spdlog::warn("Webhook drain deadline passed, dropping {} queued notifications.",
                                 queue_.size());
                    failed_ += queue_.size();
                    std::queue<Pending>().swap(queue_);
                    break;
                }
                timeout = std::min(timeout_, remaining);
            }
            item = std::move(queue_.front());
            queue_.pop();
        }
        deliver(item, timeout);
    }
}

void WebhookDispatcher::deliver(const Pending& item, std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.method = "POST";
    request.url = item.url;
    request.headers = {{"Content-Type", "application/json"}};
    request.body = item.body;
    request.timeout = timeout;
    request.read_body = false;

    auto response = transport_->send(request);
    if (!response.received()) {
        failed_++;
        spdlog::debug("Webhook delivery to {} failed: {}", item.url, *response.transport_error);
    } else if (response.status_code < 200 || response.status_code >= 300) {
        failed_++;
        spdlog::debug("Webhook {} answered with status {}", item.url, response.status_code);
    } else {
        delivered_++;
    }
}
