#include "core/trading_scheduler.hpp"
#include "utils/time_utils.hpp"
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace updown {

namespace {

struct GuardRelease {
    std::atomic<bool>& flag;
    ~GuardRelease() { flag.store(false); }
};

StrategyCalculator calculator_for(const BotSettings& settings) {
    if (settings.win_rate_table.empty()) {
        return StrategyCalculator();
    }
    return StrategyCalculator(WinRateTable(settings.win_rate_table));
}

} // namespace

nlohmann::json SchedulerStatus::to_json() const {
    nlohmann::json j = {
        {"global_enabled", global_enabled},
        {"loops_running", loops_running},
        {"read_only", read_only},
        {"scan_in_flight", scan_in_flight},
        {"stop_loss_in_flight", stop_loss_in_flight},
        {"claim_in_flight", claim_in_flight},
        {"in_trading_window", in_trading_window},
        {"minutes_until_window", minutes_until_window},
        {"stats", {
            {"total", stats.total},
            {"open", stats.open},
            {"resolved", stats.resolved},
            {"failed", stats.failed},
            {"wins", stats.wins},
            {"losses", stats.losses},
            {"total_pnl", stats.total_pnl},
            {"total_invested", stats.total_invested}
        }}
    };
    if (last_scan) {
        j["last_scan"] = {
            {"scanned_at", time_utils::to_iso8601(last_scan->scanned_at)},
            {"markets", last_scan->markets},
            {"opportunities", last_scan->opportunities},
            {"trades", last_scan->trades}
        };
    } else {
        j["last_scan"] = nullptr;
    }
    return j;
}

TradingScheduler::TradingScheduler(SchedulerServices services, ClockFn clock)
    : svc_(std::move(services))
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = wall_now;
    }
}

TradingScheduler::~TradingScheduler() {
    stop();
    tasks_.wait_all();
}

// ============================================================================
// Loops
// ============================================================================

void TradingScheduler::start() {
    std::lock_guard<std::mutex> lock(loops_mutex_);
    if (scan_task_) {
        spdlog::warn("Scheduler already running");
        return;
    }

    auto settings = svc_.settings;

    scan_task_ = std::make_unique<PeriodicTask>(
        "scan-loop",
        [settings] { return std::chrono::milliseconds(settings->get_all().advanced.scan_interval_seconds * 1000LL); },
        [this] { tick(); });

    stop_loss_task_ = std::make_unique<PeriodicTask>(
        "stop-loss-loop",
        [settings] { return std::chrono::milliseconds(settings->get_all().stop_loss.interval_seconds * 1000LL); },
        [this] { svc_.stop_loss->check_once(); });

    claim_task_ = std::make_unique<PeriodicTask>(
        "auto-claim-loop",
        [settings] { return std::chrono::milliseconds(settings->get_all().auto_claim.interval_minutes * 60000LL); },
        [this] {
            auto s = svc_.settings->get_all().auto_claim;
            if (!s.enabled) return;
            svc_.claims->claim_all(s.days_back);
        },
        false);

    scan_task_->start();
    stop_loss_task_->start();
    claim_task_->start();

    auto s = svc_.settings->get_all();
    spdlog::info("Scheduler started (scan {}s, stop-loss {}s, auto-claim {}min, trading {})",
                 s.advanced.scan_interval_seconds, s.stop_loss.interval_seconds,
                 s.auto_claim.interval_minutes, s.global_bot_enabled ? "ENABLED" : "disabled");
}

void TradingScheduler::stop() {
    std::lock_guard<std::mutex> lock(loops_mutex_);
    if (!scan_task_) return;

    scan_task_->stop();
    stop_loss_task_->stop();
    claim_task_->stop();
    scan_task_.reset();
    stop_loss_task_.reset();
    claim_task_.reset();
    spdlog::info("Scheduler stopped");
}

bool TradingScheduler::is_running() const {
    std::lock_guard<std::mutex> lock(loops_mutex_);
    return scan_task_ != nullptr;
}

void TradingScheduler::tick() {
    auto settings = svc_.settings->get_all();
    if (!settings.global_bot_enabled) return;

    if (scan_in_flight_.load()) {
        spdlog::debug("Scan in flight, tick dropped");
        return;
    }

    auto now = clock_();
    {
        std::lock_guard<std::mutex> lock(fetch_mutex_);
        auto min_gap = std::chrono::seconds(settings.advanced.min_fetch_interval_seconds);
        if (last_fetch_ && now - *last_fetch_ < min_gap) {
            spdlog::debug("Fetch throttled");
            return;
        }
        last_fetch_ = now;
    }

    run_scan(false);
}

// ============================================================================
// Scan
// ============================================================================

ScanResult TradingScheduler::force_scan(const std::optional<std::string>& asset) {
    spdlog::info("Forced scan requested{}", asset ? " for " + *asset : "");
    return run_scan(true, asset);
}

ScanResult TradingScheduler::run_scan(bool force, const std::optional<std::string>& only_asset) {
    ScanResult result;

    bool expected = false;
    if (!scan_in_flight_.compare_exchange_strong(expected, true)) {
        result.status = ResultStatus::SKIPPED;
        result.message = "Scan already in progress";
        return result;
    }
    GuardRelease release{scan_in_flight_};

    auto settings = svc_.settings->get_all();
    auto calculator = calculator_for(settings);
    auto now = clock_();

    if (only_asset && !settings.asset(*only_asset)) {
        result.status = ResultStatus::FAILED;
        result.message = "Unknown asset: " + *only_asset;
        return result;
    }

    spdlog::info("=== SCAN START {} ===", time_utils::to_iso8601(now));

    for (const auto& [asset_id, asset] : settings.assets) {
        if (only_asset && asset_id != *only_asset) continue;

        try {
            scan_asset(asset_id, asset, settings, calculator, force, now, result.summary);
        } catch (const std::exception& e) {
            result.summary.assets_failed++;
            spdlog::error("[{}] Scan failed: {}", asset_id, e.what());
        }
    }

    const auto& s = result.summary;
    try {
        svc_.store->record_scan_summary(s.markets, s.opportunities, s.trades);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record scan summary: {}", e.what());
    }

    spdlog::info("=== SCAN COMPLETE: {} markets, {} opportunities, {} trades{} ===",
                 s.markets, s.opportunities, s.trades,
                 s.assets_failed > 0 ? fmt::format(", {} assets failed", s.assets_failed) : "");

    if (s.assets_failed > 0) {
        result.status = ResultStatus::FAILED;
        result.message = fmt::format("{} assets failed", s.assets_failed);
    }
    return result;
}

void TradingScheduler::scan_asset(const std::string& asset_id, const AssetSettings& asset,
                                  const BotSettings& settings, const StrategyCalculator& calculator,
                                  bool force, WallClock now, ScanSummary& summary) {
    auto quotes = svc_.markets->list_open_markets(asset_id);
    summary.markets += static_cast<int>(quotes.size());

    std::vector<LiveMarketView> views;
    views.reserve(quotes.size());
    for (const auto& quote : quotes) {
        views.push_back(calculator.analyze(quote, asset, now));
    }
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_[asset_id] = std::move(views);
    }

    auto opportunities = calculator.find_opportunities(quotes, asset);
    summary.opportunities += static_cast<int>(opportunities.size());

    spdlog::info("[{}] {} markets, {} opportunities", asset_id, quotes.size(), opportunities.size());
    if (opportunities.empty()) return;

    if (!settings.global_bot_enabled) {
        spdlog::info("[{}] Trading disabled globally, not executing", asset_id);
        return;
    }
    if (!asset.enabled && !force) {
        spdlog::debug("[{}] Asset disabled, not executing", asset_id);
        return;
    }

    TradingWindowGate window(settings.trading_window);
    auto window_check = window.check(now);
    if (!window_check.can_trade) {
        spdlog::info("[{}] {}", asset_id, window_check.summary());
        return;
    }

    auto quick = svc_.volatility->quick_check(settings.volatility, now);
    if (!quick.can_trade) {
        spdlog::info("[{}] Blocked: {}", asset_id, quick.summary());
        return;
    }

    std::vector<Opportunity> passed;
    for (const auto& opp : opportunities) {
        auto gate = svc_.volatility->check_all(settings.volatility, asset_id, opp.token_id,
                                               opp.quote.volume_usd, now);
        if (!gate.can_trade) {
            spdlog::info("[{}] Skipping {}: {}", asset_id, opp.quote.title, gate.summary());
            continue;
        }
        passed.push_back(opp);
    }
    if (passed.empty()) return;

    auto results = svc_.engine->submit_all(passed, settings.advanced.order_delay_ms);
    for (const auto& r : results) {
        if (r.status == ResultStatus::OK) {
            summary.trades++;
        }
    }
}

// ============================================================================
// Operator controls
// ============================================================================

ControlResult TradingScheduler::apply(const std::string& what, const std::function<void(BotSettings&)>& fn) {
    ControlResult result;
    try {
        svc_.settings->modify(fn);
        result.message = what;
        spdlog::info("Settings: {}", what);
    } catch (const std::exception& e) {
        result.status = ResultStatus::FAILED;
        result.message = e.what();
        spdlog::warn("Settings change rejected ({}): {}", what, e.what());
    }
    return result;
}

namespace {

AssetSettings& asset_or_throw(BotSettings& s, const std::string& asset_id) {
    auto it = s.assets.find(asset_id);
    if (it == s.assets.end()) {
        throw std::invalid_argument("Unknown asset: " + asset_id);
    }
    return it->second;
}

} // namespace

ControlResult TradingScheduler::set_global_enabled(bool enabled) {
    return apply(fmt::format("trading {}", enabled ? "enabled" : "disabled"),
                 [enabled](BotSettings& s) { s.global_bot_enabled = enabled; });
}

ControlResult TradingScheduler::set_asset_enabled(const std::string& asset_id, bool enabled) {
    return apply(fmt::format("{} {}", asset_id, enabled ? "enabled" : "disabled"),
                 [&](BotSettings& s) { asset_or_throw(s, asset_id).enabled = enabled; });
}

ControlResult TradingScheduler::set_asset_band(const std::string& asset_id, double min_price, double max_price) {
    return apply(fmt::format("{} band {:.2f}-{:.2f}", asset_id, min_price, max_price),
                 [&](BotSettings& s) {
                     auto& a = asset_or_throw(s, asset_id);
                     a.min_price = min_price;
                     a.max_price = max_price;
                 });
}

ControlResult TradingScheduler::set_asset_bet_size(const std::string& asset_id, double bet_size) {
    return apply(fmt::format("{} bet ${:.2f}", asset_id, bet_size),
                 [&](BotSettings& s) { asset_or_throw(s, asset_id).bet_size = bet_size; });
}

ControlResult TradingScheduler::set_trading_window(int start_minute, int end_minute) {
    return apply(fmt::format("window :{:02d}-:{:02d}", start_minute, end_minute),
                 [&](BotSettings& s) {
                     s.trading_window.start_minute = start_minute;
                     s.trading_window.end_minute = end_minute;
                 });
}

ControlResult TradingScheduler::set_stop_loss(bool enabled, double threshold) {
    return apply(fmt::format("stop-loss {} at {:.2f}", enabled ? "on" : "off", normalize_threshold(threshold)),
                 [&](BotSettings& s) {
                     s.stop_loss.enabled = enabled;
                     s.stop_loss.threshold = normalize_threshold(threshold);
                 });
}

ControlResult TradingScheduler::emergency_stop() {
    spdlog::critical("EMERGENCY STOP");
    auto result = set_global_enabled(false);
    stop();
    if (result.status == ResultStatus::OK) {
        result.message = "Trading disabled and loops stopped";
    }
    return result;
}

StopLossRun TradingScheduler::trigger_stop_loss_check() {
    spdlog::info("Manual stop-loss check");
    return svc_.stop_loss->check_now();
}

int TradingScheduler::trigger_claim(int days_back) {
    auto claims = svc_.claims;
    return tasks_.spawn("claim", [claims, days_back]() -> std::string {
        auto run = claims->claim_all(days_back);
        const auto& s = run.summary;
        auto text = fmt::format("{} attempted, {} claimed, {} skipped, {} failed",
                                s.attempted, s.success, s.skipped, s.failed);
        if (run.status == ResultStatus::FAILED) {
            throw std::runtime_error(text + (run.message.empty() ? "" : ": " + run.message));
        }
        if (run.status == ResultStatus::SKIPPED) {
            return run.message;
        }
        return text;
    });
}

int TradingScheduler::approve_usdc() {
    auto settlement = svc_.settlement;
    auto speed = svc_.settings->get_all().advanced.gas_speed;
    return tasks_.spawn("approve-usdc", [settlement, speed]() -> std::string {
        if (!settlement->can_sign()) {
            throw std::runtime_error("No private key configured");
        }
        auto txs = settlement->approve_usdc(speed);
        if (txs.empty()) {
            return "All approvals already in place";
        }
        return fmt::format("{} approval transactions sent", txs.size());
    });
}

std::optional<TaskStatus> TradingScheduler::task_status(int id) const {
    return tasks_.status(id);
}

void TradingScheduler::wait_for_tasks() {
    tasks_.wait_all();
}

std::string TradingScheduler::export_settings() const {
    return svc_.settings->export_json();
}

ControlResult TradingScheduler::import_settings(const std::string& json_text) {
    ControlResult result;
    try {
        svc_.settings->import_json(json_text);
        result.message = "Settings imported";
    } catch (const std::exception& e) {
        result.status = ResultStatus::FAILED;
        result.message = e.what();
        spdlog::warn("Settings import rejected: {}", e.what());
    }
    return result;
}

ControlResult TradingScheduler::reset_settings() {
    ControlResult result;
    try {
        svc_.settings->reset_to_factory();
        result.message = "Settings reset to factory defaults";
    } catch (const std::exception& e) {
        result.status = ResultStatus::FAILED;
        result.message = e.what();
    }
    return result;
}

// ============================================================================
// Views
// ============================================================================

SchedulerStatus TradingScheduler::status() const {
    SchedulerStatus st;
    auto settings = svc_.settings->get_all();
    auto now = clock_();

    st.global_enabled = settings.global_bot_enabled;
    st.loops_running = is_running();
    st.read_only = svc_.engine->is_read_only();
    st.scan_in_flight = scan_in_flight_.load();
    st.stop_loss_in_flight = svc_.stop_loss->is_running();
    st.claim_in_flight = svc_.claims->is_running();

    TradingWindowGate window(settings.trading_window);
    int minute = time_utils::minute_of_hour(now);
    st.in_trading_window = window.is_in_window(minute);
    st.minutes_until_window = window.minutes_until_window(minute);

    try {
        st.last_scan = svc_.store->last_scan();
        st.stats = svc_.store->get_trade_stats();
    } catch (const std::exception& e) {
        spdlog::error("Failed to read trade store: {}", e.what());
    }
    return st;
}

std::map<std::string, std::vector<LiveMarketView>> TradingScheduler::live_markets() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

} // namespace updown
