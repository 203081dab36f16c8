#include "config.hpp"
#include "errors.hpp"
#include "huawei_router_client.hpp"
#include "metric_store.hpp"
#include "decision_engine.hpp"
#include "monitor_loop.hpp"
#include "optimization_scheduler.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }
    auto logger = std::make_shared<spdlog::logger>("lteband", sinks.begin(), sinks.end());

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

struct Options {
    bool test_bands = false;
    bool optimize = false;
    bool monitor = false;
    int summary_hours = 0;
    std::string export_file;
    std::string apply_bands;

    bool any_action() const {
        return test_bands || optimize || summary_hours > 0 ||
               !export_file.empty() || !apply_bands.empty();
    }
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --ip IP               router address (ROUTER_IP)\n"
              << "  --username USER       router username (ROUTER_USERNAME)\n"
              << "  --password PASS       router password (ROUTER_PASSWORD)\n"
              << "  --test-bands          test every available band and pick the best\n"
              << "  --optimize            run peak/off-peak optimization once\n"
              << "  --summary HOURS       print the metrics summary for the last HOURS (1-876000)\n"
              << "  --export-bands FILE   write the per-band comparison table\n"
              << "  --apply-bands LIST    enable only the listed bands, e.g. B3,B7\n"
              << "  --monitor             keep monitoring after the actions above\n"
              << "Without an action the agent runs as a daemon.\n";
}

// Returns false when the command line is malformed
bool parse_args(int argc, char* argv[], Config& config, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--ip" && next(value)) {
            config.router_ip = value;
        } else if (arg == "--username" && next(value)) {
            config.router_username = value;
        } else if (arg == "--password" && next(value)) {
            config.router_password = value;
        } else if (arg == "--test-bands") {
            opts.test_bands = true;
        } else if (arg == "--optimize") {
            opts.optimize = true;
        } else if (arg == "--monitor") {
            opts.monitor = true;
        } else if (arg == "--summary" && next(value)) {
            auto hours = parse_summary_hours(value);
            if (!hours) return false;
            opts.summary_hours = *hours;
        } else if (arg == "--export-bands" && next(value)) {
            opts.export_file = value;
        } else if (arg == "--apply-bands" && next(value)) {
            opts.apply_bands = value;
        } else {
            return false;
        }
    }
    return true;
}

DecisionConfig make_decision_config(const Config& config) {
    DecisionConfig dc;
    dc.degradation_threshold = config.auto_switch_threshold;
    dc.auto_switch_enabled = config.auto_switch_enabled;
    dc.peak_windows = config.peak_windows;
    dc.band_settle = std::chrono::seconds(config.switch_settle_seconds);
    dc.mask_settle = std::chrono::seconds(config.mask_settle_seconds);
    dc.band_test_sample_interval = std::chrono::seconds(config.band_test_sample_interval_seconds);
    dc.band_comparison_file = config.band_comparison_file;
    return dc;
}

void print_band_results(const BandTestReport& report) {
    for (const auto& r : report.results) {
        if (!r.ok) {
            spdlog::warn("{}: {}", r.band, r.error);
            continue;
        }
        spdlog::info("{}: RSRP {:.1f} dBm | SINR {:.1f} dB | score {:.3f} | stability {:.3f}",
                     r.band, r.performance.avg_rsrp, r.performance.avg_sinr,
                     r.performance.avg_bandwidth_score, r.performance.stability_score);
    }
}

int run_daemon(const Config& config, MetricStore& store, DecisionEngine& engine,
               MonitorLoop& monitor) {
    OptimizationScheduler scheduler(config.optimize_times, [&engine](util::TimePoint now) {
        engine.optimize_for_peak_hours(now);
    });

    HealthCheck health(store, engine, monitor,
                       std::chrono::seconds(config.measurement_interval_seconds * 3));

    httplib::Server server;

    server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
        auto status = health.get_status();
        res.set_content(status.dump(), "application/json");
        res.status = health.is_healthy() ? 200 : 503;
    });

    server.Get("/summary", [&health](const httplib::Request& req, httplib::Response& res) {
        int hours = 24;
        if (req.has_param("hours")) {
            auto parsed = parse_summary_hours(req.get_param_value("hours"));
            if (!parsed) {
                res.status = 400;
                res.set_content(R"({"error":"hours must be between 1 and 876000"})",
                                "application/json");
                return;
            }
            hours = *parsed;
        }
        res.set_content(health.summary(hours).dump(), "application/json");
    });

    server.Get("/bands", [&health](const httplib::Request&, httplib::Response& res) {
        res.set_content(health.bands().dump(), "application/json");
    });

    std::thread http_thread([&server, &config]() {
        spdlog::info("Starting HTTP server on {}:{}", config.listen_addr, config.listen_port);
        server.listen(config.listen_addr.c_str(), config.listen_port);
    });

    monitor.start();
    scheduler.start();

    spdlog::info("Agent started");

    while (!shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    spdlog::info("Stopping services...");
    scheduler.stop();
    monitor.stop();
    server.stop();
    if (http_thread.joinable()) http_thread.join();

    return 0;
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        Options opts;
        if (!parse_args(argc, argv, config, opts)) {
            print_usage(argv[0]);
            return 2;
        }

        setup_logging(config.log_level, config.log_file);

        spdlog::info("==============================================");
        spdlog::info("LTE Band Agent");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        HuaweiRouterClient router({config.router_ip, config.router_username,
                                   config.router_password},
                                  config.request_timeout_ms);

        MetricStoreOptions store_opts;
        store_opts.csv_path = config.csv_file;
        store_opts.json_path = config.json_file;
        store_opts.max_log_size_bytes = static_cast<uintmax_t>(config.max_log_size_bytes);
        MetricStore store(store_opts);

        DecisionEngine engine(router, store, make_decision_config(config));
        MonitorLoop monitor(router, store, engine,
                            std::chrono::seconds(config.measurement_interval_seconds));

        if (!router.authenticate()) {
            spdlog::error("Authentication with {} failed", config.router_ip);
            router.close();
            curl_global_cleanup();
            return 1;
        }

        auto device = router.get_connection_status();
        if (!device.empty()) {
            spdlog::info("Connected to {}", device.value("DeviceName", config.router_ip));
        }

        auto available = router.get_available_bands();
        engine.set_catalog(BandCatalog(available));
        spdlog::info("Available bands: {}", fmt::join(engine.catalog().band_names(), ", "));

        int rc = 0;
        try {
            if (!opts.apply_bands.empty()) {
                auto mask = engine.catalog().parse_mask(opts.apply_bands);
                if (!engine.set_band_configuration(mask)) {
                    rc = 1;
                }
            }

            if (opts.test_bands) {
                auto report = engine.test_all_bands(
                    engine.catalog().band_names(),
                    std::chrono::seconds(config.band_test_duration_seconds));
                print_band_results(report);
            }

            if (opts.optimize) {
                auto result = engine.optimize_for_peak_hours(std::chrono::system_clock::now());
                spdlog::info("Optimization ({}): {}",
                             result.peak_hours ? "peak" : "off-peak",
                             to_string(result.outcome.status));
            }

            if (opts.summary_hours > 0) {
                auto summary = store.summary(std::chrono::hours(opts.summary_hours));
                if (summary) {
                    std::cout << summary->to_json().dump(2) << std::endl;
                } else {
                    spdlog::warn("No metrics data in the last {} hours", opts.summary_hours);
                }
            }

            if (!opts.export_file.empty() && !store.export_band_comparison(opts.export_file)) {
                rc = 1;
            }

            if (!opts.any_action() || opts.monitor) {
                rc = run_daemon(config, store, engine, monitor);
            }

        } catch (const ConfigurationError& e) {
            spdlog::error("Configuration error: {}", e.what());
            rc = 2;
        }

        spdlog::info("Cleaning up resources...");
        monitor.stop();
        router.close();
        if (config.max_log_size_bytes > 0) {
            store.rotate(static_cast<uintmax_t>(config.max_log_size_bytes));
        }
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return rc;

    } catch (const ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
