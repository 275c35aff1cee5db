#include "config.hpp"
#include "clock.hpp"
#include "http_client.hpp"
#include "jupiter_client.hpp"
#include "solana_tracker_client.hpp"
#include "request_pacer.hpp"
#include "ntfy_client.hpp"
#include "alert_dispatcher.hpp"
#include "formatter.hpp"
#include "redis_bus.hpp"
#include "state_store.hpp"
#include "threshold_engine.hpp"
#include "price_sampler.hpp"
#include "rsi_engine.hpp"
#include "pnl_aggregator.hpp"
#include "periodic_task.hpp"
#include "health.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("jupwatch", console_sink);

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

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Jupiter Price Watch v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto clock = std::make_shared<SystemClock>();
        auto http = std::make_shared<HttpClient>(config->request_timeout_ms);
        auto redis = std::make_shared<RedisBus>(config->redis_url, config->state_key_prefix,
                                                std::chrono::milliseconds(config->request_timeout_ms));

        auto store = std::make_shared<StateStore>(redis, config->to_state_defaults());
        store->load();

        auto ntfy = std::make_shared<NtfyClient>(config->ntfy_server, config->ntfy_topic, http);
        auto dispatcher = std::make_shared<AlertDispatcher>(ntfy, redis, config->stream_alerts);
        AlertFormatter formatter(config->display_tz);

        auto jupiter = std::make_shared<JupiterClient>(config->jupiter_base, config->slippage_bps, http);

        std::shared_ptr<SolanaTrackerClient> tracker;
        if (!config->solanatracker_api_key.empty()) {
            auto pacer = std::make_shared<RequestPacer>(clock, std::chrono::milliseconds(1000));
            tracker = std::make_shared<SolanaTrackerClient>(config->solanatracker_base,
                                                            config->solanatracker_api_key,
                                                            http, pacer);
        }

        ThresholdEngine thresholds(*store, clock, dispatcher, formatter);
        PriceSampler sampler(*store, jupiter, clock, thresholds,
                             QuoteAsset{config->input_mint, config->input_decimals},
                             config->output_decimals);
        RsiEngine rsi(*store, tracker, clock, dispatcher, formatter);

        PnlPacing pacing;
        pacing.request_spacing = std::chrono::milliseconds(config->pnl_request_spacing_ms);
        pacing.retry_backoff = std::chrono::milliseconds(config->pnl_retry_backoff_ms);
        PnlAggregator pnl(*store, tracker, clock, pacing);

        auto health = std::make_shared<HealthCheck>(config->service_name, redis, *store,
                                                    rsi, pnl, *dispatcher);

        dispatcher->start();

        PeriodicTask price_task("price", std::chrono::seconds(config->check_interval_seconds),
                                [&sampler] { sampler.tick(); });
        PeriodicTask rsi_task("rsi", std::chrono::minutes(config->rsi_check_interval_minutes),
                              [&rsi] { rsi.refresh(); });
        price_task.start();
        if (rsi.enabled()) {
            rsi_task.start();
        }

        std::unique_ptr<PeriodicTask> pnl_task;
        if (pnl.enabled() && config->pnl_refresh_minutes > 0) {
            pnl_task = std::make_unique<PeriodicTask>(
                "pnl", std::chrono::minutes(config->pnl_refresh_minutes),
                [&pnl] {
                    auto outcome = pnl.request_refresh();
                    spdlog::debug("Scheduled PnL refresh: {}", outcome_string(outcome));
                });
            pnl_task->start();
        } else if (pnl.enabled()) {
            spdlog::info("PNL_REFRESH_MINUTES is 0, PnL refreshes only on request");
        }

        // Start HTTP health server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("{} started for {}", config->service_name,
                     util::short_address(store->tracked_token()));

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        server.stop();
        if (pnl_task) pnl_task->stop();
        rsi_task.stop();
        price_task.stop();
        pnl.cancel();
        pnl.join();
        dispatcher->stop();

        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
