#include <gtest/gtest.h>
#include "core/trading_scheduler.hpp"
#include "utils/time_utils.hpp"
#include "fakes.hpp"

using namespace updown;
using namespace updown::testing_fakes;

class TradingSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = time_utils::from_iso8601("2025-01-01T16:50:00Z");

        settings_ = std::make_shared<SettingsManager>();
        settings_->update({{"global_bot_enabled", true}});
        markets_ = std::make_shared<FakeMarketDataSource>();
        exchange_ = std::make_shared<FakeExchange>();
        store_ = std::make_shared<InMemoryTradeStore>();
        settlement_ = std::make_shared<FakeSettlement>();
        auto no_sleep = [](std::chrono::milliseconds) {};

        SchedulerServices svc;
        svc.settings = settings_;
        svc.markets = markets_;
        svc.volatility = std::make_shared<VolatilityGate>(std::make_shared<FakeSpotFeed>(), exchange_);
        svc.engine = std::make_shared<ExecutionEngine>(exchange_, store_, no_sleep);
        svc.stop_loss = std::make_shared<StopLossMonitor>(exchange_, svc.engine, store_, settings_);
        svc.claims = std::make_shared<ClaimSweeper>(markets_, settlement_, store_, settings_, no_sleep);
        svc.store = store_;
        svc.settlement = settlement_;
        scheduler_ = std::make_unique<TradingScheduler>(svc, [this] { return now_; });

        markets_->open["btc"] = {make_quote("m1", 0.92, 0.08), make_quote("m2", 0.50, 0.50)};
        exchange_->set_book("m1-up", {{0.91, 500.0}}, {{0.93, 500.0}});
    }

    void TearDown() override {
        scheduler_.reset();
    }

    void at(const std::string& iso) {
        now_ = time_utils::from_iso8601(iso);
    }

    WallClock now_;
    std::shared_ptr<SettingsManager> settings_;
    std::shared_ptr<FakeMarketDataSource> markets_;
    std::shared_ptr<FakeExchange> exchange_;
    std::shared_ptr<InMemoryTradeStore> store_;
    std::shared_ptr<FakeSettlement> settlement_;
    std::unique_ptr<TradingScheduler> scheduler_;
};

// ============================================================================
// Scan pipeline
// ============================================================================

TEST_F(TradingSchedulerTest, InsideWindow_ExecutesOpportunity) {
    markets_->open["btc"] = {make_quote("m1", 0.92, 0.08)};

    auto result = scheduler_->run_scan(false);

    EXPECT_EQ(result.status, ResultStatus::OK);
    EXPECT_EQ(result.summary.markets, 1);
    EXPECT_EQ(result.summary.opportunities, 1);
    EXPECT_EQ(result.summary.trades, 1);

    auto trade = store_->find_open_trade_by_market("m1");
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->side, Outcome::UP);
    EXPECT_EQ(trade->status, TradeStatus::OPEN);

    ASSERT_EQ(store_->scans.size(), 1u);
    EXPECT_EQ(store_->scans[0].markets, 1);
    EXPECT_EQ(store_->scans[0].opportunities, 1);
    EXPECT_EQ(store_->scans[0].trades, 1);
}

TEST_F(TradingSchedulerTest, OutsideWindow_CountsButDoesNotTrade) {
    markets_->open["btc"] = {make_quote("m1", 0.92, 0.08)};
    at("2025-01-01T16:30:00Z");

    auto result = scheduler_->run_scan(false);
    EXPECT_EQ(result.summary.markets, 1);
    EXPECT_EQ(result.summary.opportunities, 1);
    EXPECT_EQ(result.summary.trades, 0);
    EXPECT_TRUE(exchange_->submitted.empty());
    ASSERT_EQ(store_->scans.size(), 1u);
    EXPECT_EQ(store_->scans[0].trades, 0);
    EXPECT_TRUE(scheduler_->live_markets()["btc"][0].is_viable);
}

TEST_F(TradingSchedulerTest, GlobalSwitchOff_NoExecution) {
    scheduler_->set_global_enabled(false);

    auto result = scheduler_->run_scan(false);
    EXPECT_EQ(result.summary.opportunities, 1);
    EXPECT_EQ(result.summary.trades, 0);
    EXPECT_TRUE(store_->all().empty());
}

TEST_F(TradingSchedulerTest, SecondScan_DoesNotDuplicateTrade) {
    scheduler_->run_scan(false);
    auto again = scheduler_->run_scan(false);

    EXPECT_EQ(again.summary.opportunities, 1);
    EXPECT_EQ(again.summary.trades, 0);
    EXPECT_EQ(exchange_->submitted.size(), 1u);
}

TEST_F(TradingSchedulerTest, VolatileHour_BlocksExecution) {
    nlohmann::json volatility = {{"enabled", true}, {"skip_volatile_hours", true}};
    volatility["volatile_hours_et"] = nlohmann::json::array({11});
    settings_->update({{"volatility", volatility}});
    // 16:50 UTC is 11:50 EST
    auto result = scheduler_->run_scan(false);
    EXPECT_EQ(result.summary.trades, 0);
}

TEST_F(TradingSchedulerTest, FailingAsset_OthersContinue) {
    settings_->update({{"assets", {{"eth", {{"enabled", true}}}}}});
    markets_->failing["eth"] = "gamma timeout";

    auto result = scheduler_->run_scan(false);
    EXPECT_EQ(result.status, ResultStatus::FAILED);
    EXPECT_EQ(result.summary.assets_failed, 1);
    EXPECT_EQ(result.summary.trades, 1);
    EXPECT_EQ(store_->scans.size(), 1u);
}

TEST_F(TradingSchedulerTest, DisabledAsset_SnapshotRefreshedButNotTraded) {
    markets_->open["eth"] = {make_quote("e1", 0.93, 0.07, "eth")};
    exchange_->set_book("e1-up", {}, {{0.93, 500.0}});

    auto result = scheduler_->run_scan(false);
    EXPECT_EQ(result.summary.opportunities, 2);
    EXPECT_EQ(result.summary.trades, 1);
    EXPECT_FALSE(store_->find_open_trade_by_market("e1").has_value());

    auto live = scheduler_->live_markets();
    ASSERT_EQ(live["eth"].size(), 1u);
    EXPECT_TRUE(live["eth"][0].is_viable);
    EXPECT_EQ(live["btc"].size(), 2u);
}

TEST_F(TradingSchedulerTest, ForceScan_BypassesAssetFlagOnly) {
    markets_->open["eth"] = {make_quote("e1", 0.93, 0.07, "eth")};
    exchange_->set_book("e1-up", {}, {{0.93, 500.0}});

    auto forced = scheduler_->force_scan(std::string("eth"));
    EXPECT_EQ(forced.summary.markets, 1);
    EXPECT_EQ(forced.summary.trades, 1);
    EXPECT_TRUE(store_->find_open_trade_by_market("e1").has_value());
    // Only the requested asset was scanned
    EXPECT_FALSE(store_->find_open_trade_by_market("m1").has_value());

    scheduler_->set_global_enabled(false);
    auto blocked = scheduler_->force_scan();
    EXPECT_EQ(blocked.summary.trades, 0);
}

TEST_F(TradingSchedulerTest, ScanInFlight_SecondScanSkipped) {
    std::optional<ScanResult> nested;
    markets_->on_list = [&]() {
        if (!nested) nested = scheduler_->force_scan();
    };

    auto outer = scheduler_->run_scan(false);
    EXPECT_EQ(outer.status, ResultStatus::OK);
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->status, ResultStatus::SKIPPED);
    EXPECT_EQ(nested->message, "Scan already in progress");
    EXPECT_FALSE(scheduler_->status().scan_in_flight);
}

TEST_F(TradingSchedulerTest, ForceScan_UnknownAsset) {
    auto result = scheduler_->force_scan(std::string("doge"));
    EXPECT_EQ(result.status, ResultStatus::FAILED);
    EXPECT_EQ(result.message, "Unknown asset: doge");
}

TEST_F(TradingSchedulerTest, InjectedWinRateTable_ChangesExpectedValue) {
    scheduler_->run_scan(false);
    double default_ev = scheduler_->live_markets()["btc"][0].expected_value;

    nlohmann::json band = {{"min_price", 0.5}, {"win_rate", 0.95}};
    nlohmann::json table = nlohmann::json::array();
    table.push_back(band);
    settings_->update({{"win_rate_table", table}});
    scheduler_->run_scan(false);
    double custom_ev = scheduler_->live_markets()["btc"][0].expected_value;

    EXPECT_GT(default_ev, custom_ev);
    EXPECT_NEAR(custom_ev, (0.95 - 0.92) * (90.0 / 0.92), 1e-9);
}

// ============================================================================
// Tick throttling
// ============================================================================

TEST_F(TradingSchedulerTest, Tick_ThrottlesMarketFetches) {
    scheduler_->tick();
    int after_first = markets_->open_calls;
    EXPECT_EQ(after_first, 3);   // btc, eth, sol

    scheduler_->tick();
    EXPECT_EQ(markets_->open_calls, after_first);

    now_ += std::chrono::seconds(3);
    scheduler_->tick();
    EXPECT_EQ(markets_->open_calls, 2 * after_first);
}

TEST_F(TradingSchedulerTest, Tick_NoOpWhenGloballyDisabled) {
    scheduler_->set_global_enabled(false);
    scheduler_->tick();
    EXPECT_EQ(markets_->open_calls, 0);
    EXPECT_TRUE(store_->scans.empty());
}

// ============================================================================
// Controls
// ============================================================================

TEST_F(TradingSchedulerTest, Controls_ValidateBeforeApplying) {
    EXPECT_EQ(scheduler_->set_asset_band("btc", 0.95, 0.90).status, ResultStatus::FAILED);
    EXPECT_DOUBLE_EQ(settings_->get_all().assets.at("btc").min_price, 0.90);

    auto unknown = scheduler_->set_asset_enabled("doge", true);
    EXPECT_EQ(unknown.status, ResultStatus::FAILED);
    EXPECT_EQ(unknown.message, "Unknown asset: doge");

    EXPECT_EQ(scheduler_->set_trading_window(70, 5).status, ResultStatus::FAILED);
    EXPECT_EQ(scheduler_->set_asset_bet_size("btc", -1.0).status, ResultStatus::FAILED);

    EXPECT_EQ(scheduler_->set_asset_band("sol", 0.80, 0.85).status, ResultStatus::OK);
    EXPECT_DOUBLE_EQ(settings_->get_all().assets.at("sol").max_price, 0.85);

    EXPECT_EQ(scheduler_->set_trading_window(55, 5).status, ResultStatus::OK);
}

TEST_F(TradingSchedulerTest, StopLossThresholdInCents) {
    EXPECT_EQ(scheduler_->set_stop_loss(true, 65).status, ResultStatus::OK);
    EXPECT_DOUBLE_EQ(settings_->get_all().stop_loss.threshold, 0.65);
}

TEST_F(TradingSchedulerTest, EmergencyStop_DisablesAndStopsLoops) {
    markets_->open.clear();
    scheduler_->start();
    EXPECT_TRUE(scheduler_->is_running());

    auto result = scheduler_->emergency_stop();
    EXPECT_EQ(result.status, ResultStatus::OK);
    EXPECT_FALSE(scheduler_->is_running());
    EXPECT_FALSE(settings_->get_all().global_bot_enabled);
}

TEST_F(TradingSchedulerTest, ImportExportReset) {
    scheduler_->set_asset_bet_size("btc", 25.0);
    auto exported = scheduler_->export_settings();

    EXPECT_EQ(scheduler_->reset_settings().status, ResultStatus::OK);
    EXPECT_DOUBLE_EQ(settings_->get_all().assets.at("btc").bet_size, 90.0);

    EXPECT_EQ(scheduler_->import_settings(exported).status, ResultStatus::OK);
    EXPECT_DOUBLE_EQ(settings_->get_all().assets.at("btc").bet_size, 25.0);

    EXPECT_EQ(scheduler_->import_settings("not json").status, ResultStatus::FAILED);
}

// ============================================================================
// Background tasks
// ============================================================================

TEST_F(TradingSchedulerTest, TriggerClaim_ReportsSummary) {
    ResolvedMarket m;
    m.asset_id = "btc";
    m.market_id = "c1";
    m.winner = Outcome::UP;
    markets_->resolved["btc"] = {m};

    int id = scheduler_->trigger_claim(7);
    scheduler_->wait_for_tasks();

    auto st = scheduler_->task_status(id);
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->name, "claim");
    EXPECT_EQ(st->state, TaskState::SUCCEEDED);
    EXPECT_EQ(st->message, "1 attempted, 1 claimed, 0 skipped, 0 failed");
    EXPECT_TRUE(st->finished_at.has_value());
}

TEST_F(TradingSchedulerTest, TriggerClaim_FailureMarksTaskFailed) {
    ResolvedMarket m;
    m.asset_id = "btc";
    m.market_id = "c1";
    markets_->resolved["btc"] = {m};
    settlement_->redeem_errors["c1"] = "condition not resolved";

    int id = scheduler_->trigger_claim(7);
    scheduler_->wait_for_tasks();

    auto st = scheduler_->task_status(id);
    EXPECT_EQ(st->state, TaskState::FAILED);
    EXPECT_NE(st->message.find("c1: condition not resolved"), std::string::npos);
}

TEST_F(TradingSchedulerTest, ApproveUsdc) {
    settlement_->signer = false;
    int no_key = scheduler_->approve_usdc();
    scheduler_->wait_for_tasks();
    EXPECT_EQ(scheduler_->task_status(no_key)->state, TaskState::FAILED);
    EXPECT_EQ(scheduler_->task_status(no_key)->message, "No private key configured");

    settlement_->signer = true;
    int done = scheduler_->approve_usdc();
    scheduler_->wait_for_tasks();
    EXPECT_EQ(scheduler_->task_status(done)->message, "All approvals already in place");

    settlement_->approvals = {TxOutcome{}, TxOutcome{}};
    int sent = scheduler_->approve_usdc();
    scheduler_->wait_for_tasks();
    EXPECT_EQ(scheduler_->task_status(sent)->message, "2 approval transactions sent");
    EXPECT_FALSE(scheduler_->task_status(9999).has_value());
}

// ============================================================================
// Status
// ============================================================================

TEST_F(TradingSchedulerTest, Status_ReflectsWindowAndHistory) {
    auto before = scheduler_->status();
    EXPECT_TRUE(before.global_enabled);
    EXPECT_FALSE(before.loops_running);
    EXPECT_FALSE(before.read_only);
    EXPECT_TRUE(before.in_trading_window);
    EXPECT_EQ(before.minutes_until_window, 0);
    EXPECT_FALSE(before.last_scan.has_value());

    scheduler_->run_scan(false);
    at("2025-01-01T17:30:00Z");

    auto after = scheduler_->status();
    EXPECT_FALSE(after.in_trading_window);
    EXPECT_EQ(after.minutes_until_window, 15);
    ASSERT_TRUE(after.last_scan.has_value());
    EXPECT_EQ(after.stats.open, 1);

    auto j = after.to_json();
    EXPECT_EQ(j["stats"]["open"], 1);
    EXPECT_EQ(j["last_scan"]["trades"], 1);
}
