#include "status_server.hpp"
#include "reporter.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>

class StatusServer::Impl {
public:
    Impl(const std::string& host, int port, SnapshotProvider provider)
        : host_(host), port_(port), provider_(std::move(provider)), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Status server already running");
            return;
        }

        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body = {{"status", "healthy"}, {"service", "httpmon"}};
            res.set_content(body.dump(), "application/json");
        });

        server_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            try {
                auto document = Reporter::summary_json(provider_());
                res.set_content(document.dump(2), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("Failed to build status document: {}", e.what());
                res.status = 500;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            }
        });

        // Bind before spawning so stop() always has a socket to shut down
        if (!server_.bind_to_port(host_.c_str(), port_)) {
            throw std::runtime_error(fmt::format("Failed to bind status server on {}:{}", host_, port_));
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Status server listening on {}:{}", host_, port_);
            if (!server_.listen_after_bind()) {
                spdlog::debug("Status server listener exited");
            }
            running_ = false;
        });
    }

    void stop() {
        if (server_thread_.joinable()) {
            server_.stop();
            server_thread_.join();
            spdlog::info("Status server stopped");
        }
        running_ = false;
    }

    bool is_running() const {
        return running_;
    }

private:
    std::string host_;
    int port_;
    SnapshotProvider provider_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

StatusServer::StatusServer(const std::string& host, int port, SnapshotProvider provider)
    : pImpl_(std::make_unique<Impl>(host, port, std::move(provider))) {}

StatusServer::~StatusServer() = default;

void StatusServer::start() {
    pImpl_->start();
}

void StatusServer::stop() {
    pImpl_->stop();
}

bool StatusServer::is_running() const {
    return pImpl_->is_running();
}
