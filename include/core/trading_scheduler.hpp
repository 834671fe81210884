#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/settings.hpp"
#include "market_data/market_data_source.hpp"
#include "strategy/strategy_calculator.hpp"
#include "risk/trading_window.hpp"
#include "risk/volatility_gate.hpp"
#include "execution/execution_engine.hpp"
#include "execution/claim_sweeper.hpp"
#include "chain/settlement_client.hpp"
#include "persistence/trade_store.hpp"
#include "core/stop_loss_monitor.hpp"
#include "core/periodic_task.hpp"
#include "core/background_tasks.hpp"

namespace updown {

struct ScanResult {
    ResultStatus status{ResultStatus::OK};
    ScanSummary summary;
    std::string message;
};

struct ControlResult {
    ResultStatus status{ResultStatus::OK};
    std::string message;
};

struct SchedulerStatus {
    bool global_enabled{false};
    bool loops_running{false};
    bool read_only{true};
    bool scan_in_flight{false};
    bool stop_loss_in_flight{false};
    bool claim_in_flight{false};
    bool in_trading_window{false};
    int minutes_until_window{0};
    std::optional<ScanRecord> last_scan;
    TradeStats stats;

    nlohmann::json to_json() const;
};

/**
 * Collaborators wired once at startup and shared by the scheduler.
 */
struct SchedulerServices {
    std::shared_ptr<SettingsManager> settings;
    std::shared_ptr<MarketDataSource> markets;
    std::shared_ptr<VolatilityGate> volatility;
    std::shared_ptr<ExecutionEngine> engine;
    std::shared_ptr<StopLossMonitor> stop_loss;
    std::shared_ptr<ClaimSweeper> claims;
    std::shared_ptr<TradeStore> store;
    std::shared_ptr<SettlementClient> settlement;
};

/**
 * Scan -> decide -> gate -> execute pipeline plus the stop-loss and
 * auto-claim loops. Each of the three activities has its own in-flight
 * guard; a tick that finds its guard held is dropped, not queued.
 */
class TradingScheduler {
public:
    explicit TradingScheduler(SchedulerServices services, ClockFn clock = wall_now);
    ~TradingScheduler();

    TradingScheduler(const TradingScheduler&) = delete;
    TradingScheduler& operator=(const TradingScheduler&) = delete;

    // Periodic loops
    void start();
    void stop();
    bool is_running() const;

    // Periodic entry point; no-op when disabled, busy or throttled
    void tick();

    // Assets are processed sequentially; SKIPPED when a scan is in flight
    ScanResult run_scan(bool force, const std::optional<std::string>& only_asset = std::nullopt);

    // Bypasses the per-asset enabled flag, still requires the global switch to execute
    ScanResult force_scan(const std::optional<std::string>& asset = std::nullopt);

    // ========================================================================
    // Operator controls
    // ========================================================================

    ControlResult set_global_enabled(bool enabled);
    ControlResult set_asset_enabled(const std::string& asset_id, bool enabled);
    ControlResult set_asset_band(const std::string& asset_id, double min_price, double max_price);
    ControlResult set_asset_bet_size(const std::string& asset_id, double bet_size);
    ControlResult set_trading_window(int start_minute, int end_minute);
    ControlResult set_stop_loss(bool enabled, double threshold);

    // Global switch off and every loop stopped
    ControlResult emergency_stop();

    StopLossRun trigger_stop_loss_check();

    // Background tasks; poll with task_status()
    int trigger_claim(int days_back);
    int approve_usdc();
    std::optional<TaskStatus> task_status(int id) const;
    void wait_for_tasks();

    std::string export_settings() const;
    ControlResult import_settings(const std::string& json_text);
    ControlResult reset_settings();

    SchedulerStatus status() const;
    std::map<std::string, std::vector<LiveMarketView>> live_markets() const;

private:
    SchedulerServices svc_;
    ClockFn clock_;

    std::atomic<bool> scan_in_flight_{false};
    std::mutex fetch_mutex_;
    std::optional<WallClock> last_fetch_;

    mutable std::mutex snapshot_mutex_;
    std::map<std::string, std::vector<LiveMarketView>> snapshot_;

    mutable std::mutex loops_mutex_;
    std::unique_ptr<PeriodicTask> scan_task_;
    std::unique_ptr<PeriodicTask> stop_loss_task_;
    std::unique_ptr<PeriodicTask> claim_task_;

    BackgroundTaskRunner tasks_;

    void scan_asset(const std::string& asset_id, const AssetSettings& asset,
                    const BotSettings& settings, const StrategyCalculator& calculator,
                    bool force, WallClock now, ScanSummary& summary);

    ControlResult apply(const std::string& what, const std::function<void(BotSettings&)>& fn);
};

} // namespace updown
