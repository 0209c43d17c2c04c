#include "cert_inspector.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "monitor.hpp"
#include "status_server.hpp"
#include "util.hpp"
#include "webhook_dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <fstream>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " <config.json>      Start monitoring the configured targets\n"
              << "  " << program << " --init [path]      Write an example configuration (default: httpmon.json)\n";
}

int write_example_config(const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        spdlog::critical("Cannot open {} for writing", path);
        return 1;
    }
    out << Config::example().to_json().dump(2) << "\n";
    if (!out) {
        spdlog::critical("Failed to write example configuration to {}", path);
        return 1;
    }
    spdlog::info("Example configuration written to {}", path);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Bootstrap logging until the configuration names a level and file
    util::setup_logging(util::get_env_var("LOG_LEVEL", "info"));

    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string first = argv[1];
    if (first == "--init") {
        return write_example_config(argc == 3 ? argv[2] : "httpmon.json");
    }
    if (argc != 2 || util::starts_with(first, "-")) {
        print_usage(argv[0]);
        return 1;
    }

    // Block termination signals in every thread; a dedicated thread waits for them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        spdlog::critical("Failed to block termination signals");
        return 1;
    }

    try {
        // Load configuration
        Config config = Config::from_file(first);
        config.apply_env_overrides();
        config.validate();

        util::setup_logging(config.settings.log_level, config.settings.log_file);
        spdlog::info("Configuration loaded from {}: {} targets, {} alert rules",
                     first, config.targets.size(), config.alerts.size());

        auto transport = std::make_shared<CprTransport>();
        auto cert_inspector = std::make_shared<TlsCertInspector>();
        auto dispatcher = std::make_shared<WebhookDispatcher>(transport);
        dispatcher->start();

        Monitor monitor(config, Monitor::Collaborators{transport, cert_inspector, dispatcher});

        std::unique_ptr<StatusServer> status_server;
        if (config.settings.status_port > 0) {
            status_server = std::make_unique<StatusServer>(
                config.settings.status_host, config.settings.status_port,
                [&monitor]() { return monitor.snapshot_all(); });
            status_server->start();
        }

        std::thread signal_thread([&signals, &monitor]() {
            int signum = 0;
            if (sigwait(&signals, &signum) == 0) {
                if (signum != 0) {
                    spdlog::warn("Signal {} received, initiating graceful shutdown.", signum);
                }
            } else {
                spdlog::error("sigwait failed, stopping monitor");
            }
            monitor.stop();
        });

        try {
            monitor.run();
        } catch (const std::exception&) {
            // Wake the signal thread so it can be joined before unwinding
            pthread_kill(signal_thread.native_handle(), SIGTERM);
            signal_thread.join();
            throw;
        }
        signal_thread.join();

        if (status_server) {
            status_server->stop();
        }
        dispatcher->stop();

        spdlog::info("HTTP monitor has shut down. Exiting.");

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
