#include <iostream>
#include <fstream>
#include <sstream>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "config/settings.hpp"
#include "utils/http_client.hpp"
#include "chain/json_rpc_client.hpp"
#include "chain/rpc_pool.hpp"
#include "chain/gas_oracle.hpp"
#include "chain/settlement_client.hpp"
#include "market_data/market_data_source.hpp"
#include "market_data/spot_price_feed.hpp"
#include "exchange/polymarket_clob_client.hpp"
#include "risk/volatility_gate.hpp"
#include "execution/execution_engine.hpp"
#include "execution/claim_sweeper.hpp"
#include "persistence/sqlite_trade_store.hpp"
#include "core/stop_loss_monitor.hpp"
#include "core/trading_scheduler.hpp"

using namespace updown;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/updown.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("updown", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

void ensure_parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Blocks until a background task leaves RUNNING; returns its exit code
int await_task(TradingScheduler& scheduler, int id) {
    while (true) {
        auto st = scheduler.task_status(id);
        if (!st) return 1;
        if (st->state != TaskState::RUNNING) {
            std::cout << st->name << ": " << task_state_to_string(st->state)
                      << " - " << st->message << "\n";
            return st->state == TaskState::SUCCEEDED ? 0 : 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"updown_trader - hourly up/down threshold trader"};

    std::string config_path = "configs/config.json";
    std::string force_scan_asset;
    int claim_days = 0;
    bool check_stop_loss = false;
    bool approve = false;
    std::string export_path;
    std::string import_path;
    bool reset_settings = false;
    bool show_status = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    auto* force_opt = app.add_option("--force-scan", force_scan_asset,
                                     "Run one scan now (optionally for a single asset) and exit")
        ->expected(0, 1);
    auto* claim_opt = app.add_option("--claim", claim_days, "Run the claim sweep (days back) and exit")
        ->expected(0, 1);
    app.add_flag("--check-stop-loss", check_stop_loss, "Run one stop-loss pass and exit");
    app.add_flag("--approve", approve, "Send USDC and CTF trading approvals and exit");
    app.add_option("--export-settings", export_path, "Write current settings to FILE and exit");
    app.add_option("--import-settings", import_path, "Load settings from FILE and exit")
        ->check(CLI::ExistingFile);
    app.add_flag("--reset-settings", reset_settings, "Restore factory settings and exit");
    app.add_flag("--status", show_status, "Print status as JSON and exit");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "updown_trader v0.3.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    config.load_secrets_from_env();

    setup_logging(config.logging);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Initializing updown_trader...");

    std::shared_ptr<SettingsManager> settings;
    std::shared_ptr<SqliteTradeStore> store;
    try {
        ensure_parent_dir(config.settings_path);
        ensure_parent_dir(config.database_path);
        settings = std::make_shared<SettingsManager>(config.settings_path);
        store = std::make_shared<SqliteTradeStore>(config.database_path);
    } catch (const std::exception& e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }

    auto http = std::make_shared<CurlHttpClient>(config.connection.http_timeout_ms);

    // Exchange
    auto clob = std::make_shared<PolymarketClobClient>(config, http);
    if (clob->is_read_only()) {
        spdlog::warn("No private key configured - READ-ONLY mode, orders are simulated");
    } else if (!clob->initialize()) {
        spdlog::warn("API credentials unavailable at startup, will retry on first order");
    }

    // Chain
    auto rpc = std::make_shared<HttpJsonRpcClient>(http);
    auto pool = std::make_shared<RpcEndpointPool>(config.chain.rpc_urls, rpc);
    pool->set_preferred(settings->get_all().advanced.rpc_url);
    settings->on_change([pool](const BotSettings& s) { pool->set_preferred(s.advanced.rpc_url); });

    auto gas_station = std::make_shared<PolygonGasStation>(http, config.connection.gas_station_url);
    auto gas = std::make_shared<GasPriceSelector>(gas_station, config.chain.gas_fallback_margin);

    std::shared_ptr<EvmWallet> wallet;
    if (!config.private_key.empty()) {
        try {
            wallet = std::make_shared<EvmWallet>(config.private_key);
            spdlog::info("Settlement wallet {}", wallet->address());
        } catch (const std::exception& e) {
            spdlog::error("Invalid private key: {}", e.what());
            return 1;
        }
    }
    auto settlement = std::make_shared<PolygonSettlementClient>(config.chain, pool, gas, wallet);

    // Market data
    auto markets = std::make_shared<GammaMarketDataSource>(config, http);
    auto spot = std::make_shared<BinanceSpotFeed>(http, config.connection.binance_rest_url, config.spot_symbols);

    // Pipeline
    auto volatility = std::make_shared<VolatilityGate>(spot, clob);
    auto engine = std::make_shared<ExecutionEngine>(clob, store);
    auto stop_loss = std::make_shared<StopLossMonitor>(clob, engine, store, settings);
    auto claims = std::make_shared<ClaimSweeper>(markets, settlement, store, settings);

    SchedulerServices services;
    services.settings = settings;
    services.markets = markets;
    services.volatility = volatility;
    services.engine = engine;
    services.stop_loss = stop_loss;
    services.claims = claims;
    services.store = store;
    services.settlement = settlement;

    TradingScheduler scheduler(services);

    // ========================================================================
    // One-shot commands
    // ========================================================================

    if (!export_path.empty()) {
        std::ofstream out(export_path);
        if (!out.is_open()) {
            spdlog::error("Cannot write {}", export_path);
            return 1;
        }
        out << scheduler.export_settings() << "\n";
        spdlog::info("Settings exported to {}", export_path);
        return 0;
    }

    if (!import_path.empty()) {
        ControlResult r;
        try {
            r = scheduler.import_settings(read_file(import_path));
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
        std::cout << r.message << "\n";
        return r.status == ResultStatus::OK ? 0 : 1;
    }

    if (reset_settings) {
        auto r = scheduler.reset_settings();
        std::cout << r.message << "\n";
        return r.status == ResultStatus::OK ? 0 : 1;
    }

    if (show_status) {
        auto j = scheduler.status().to_json();
        j["settings"] = nlohmann::json::parse(scheduler.export_settings());
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    if (force_opt->count() > 0) {
        std::optional<std::string> asset;
        if (!force_scan_asset.empty()) asset = force_scan_asset;
        auto r = scheduler.force_scan(asset);
        std::cout << "Scan " << result_status_to_string(r.status) << ": "
                  << r.summary.markets << " markets, " << r.summary.opportunities << " opportunities, "
                  << r.summary.trades << " trades";
        if (!r.message.empty()) std::cout << " (" << r.message << ")";
        std::cout << "\n";
        return r.status == ResultStatus::FAILED ? 1 : 0;
    }

    if (claim_opt->count() > 0) {
        int days = claim_days > 0 ? claim_days : settings->get_all().auto_claim.days_back;
        return await_task(scheduler, scheduler.trigger_claim(days));
    }

    if (check_stop_loss) {
        auto r = scheduler.trigger_stop_loss_check();
        std::cout << "Stop-loss " << result_status_to_string(r.status) << ": "
                  << r.summary.checked << " checked, " << r.summary.sold << " sold, "
                  << r.summary.failed << " failed";
        if (!r.message.empty()) std::cout << " (" << r.message << ")";
        std::cout << "\n";
        return r.status == ResultStatus::FAILED ? 1 : 0;
    }

    if (approve) {
        return await_task(scheduler, scheduler.approve_usdc());
    }

    // ========================================================================
    // Scheduler loop
    // ========================================================================

    scheduler.start();
    spdlog::info("Running. Press Ctrl+C to stop.");

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    spdlog::info("Shutdown signal received");
    scheduler.stop();
    scheduler.wait_for_tasks();
    spdlog::info("Shutdown complete");
    return 0;
}
