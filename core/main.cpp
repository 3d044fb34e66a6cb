#include "handlers/handlers.hpp"
#include "loadwatch_server.hpp"
#include "middleware/middleware.hpp"
#include "route/router.hpp"

#include "loadwatch/config/app_config.h"
#include "loadwatch/metrics/process_stats.h"
#include "loadwatch/metrics/registry.h"
#include "loadwatch/metrics/request_collector.h"
#include "loadwatch/utils/logger.h"

#include <charconv>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <pthread.h>

using namespace loadwatch;

static const char* kVersion = "0.1.0";

static void print_usage(std::ostream& os) {
    os << "Usage:\n"
       << "  loadwatch-server [--config <path>] [--port N]\n"
       << "  loadwatch-server --help\n"
       << "  loadwatch-server --version\n"
       << "\n"
       << "Options:\n"
       << "  --config <path>   TOML configuration file.\n"
       << "  --port N          Listening port; overrides the config file and PORT.\n"
       << "\n"
       << "Endpoints:\n"
       << "  GET /health       Liveness probe.\n"
       << "  GET /metrics      Prometheus text exposition (path configurable).\n";
}

static bool parse_int(const std::string& s, int& out) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return false;
    out = v;
    return true;
}

int main(int argc, char** argv) {
    std::string config_path;
    int port_override = 0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a == "--help" || a == "-h") {
            print_usage(std::cout);
            return 0;
        }
        if (a == "--version") {
            std::cout << "loadwatch-server v" << kVersion << "\n";
            return 0;
        }
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (a == "--port" && i + 1 < argc) {
            if (!parse_int(argv[++i], port_override) || port_override <= 0) {
                std::cerr << "Invalid --port value (must be a positive integer).\n";
                return 64;
            }
            continue;
        }

        std::cerr << "Unknown argument: " << a << "\n";
        print_usage(std::cerr);
        return 64;
    }

    AppConfig config;
    if (!config_path.empty()) {
        auto loaded = AppConfig::from_toml_file(config_path);
        if (!loaded) {
            std::cerr << "Error: cannot load configuration from " << config_path << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    config.apply_env();
    if (port_override > 0) {
        config.server.port = port_override;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            std::cerr << "Invalid configuration: " << p << "\n";
        }
        return 1;
    }
    const bool log_file_ok = configure_logging(config.logging);
    auto& logger = LoggerFactory::get_logger("main");
    if (!log_file_ok) {
        logger.with_field("file", config.logging.file).warn("Cannot open log file, logging to console");
    }

    // Block the shutdown signals in every thread; a dedicated thread waits for them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        logger.fatal("Cannot block shutdown signals");
        return 1;
    }

    try {
        metrics::MetricsRegistry registry;
        metrics::RequestCollector collector(registry,
                                            metrics::HistogramBuckets(config.metrics.duration_buckets_ms));
        if (config.metrics.collect_process_metrics) {
            metrics::register_process_metrics(registry);
        }

        auto router = std::make_shared<Router>();
        handlers::register_builtin_routes(*router, registry, config.metrics.metrics_path);

        MiddlewareChain chain;
        chain.push_back("request_logger",
                        MiddlewareFactory::create_request_logger(LoggerFactory::get_logger("http")));
        chain.push_back("metrics", MiddlewareFactory::create_metrics(collector));

        Server server(config.server, router, std::move(chain));

        std::thread signal_thread([&server, &logger, signals]() {
            int sig = 0;
            if (sigwait(&signals, &sig) == 0 && server.is_running()) {
                logger.with_field("signal", sig).info("Shutdown requested");
            }
            server.shutdown();
        });

        auto result = server.run();

        // Release the signal thread if the server stopped on its own
        pthread_kill(signal_thread.native_handle(), SIGTERM);
        signal_thread.join();

        LoggerFactory::flush_all();
        if (!result) {
            std::cerr << "Error: " << error_to_string(result.error()) << "\n";
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        logger.fatal(std::string("Startup failed: ") + e.what());
        LoggerFactory::flush_all();
        return 1;
    }
}
