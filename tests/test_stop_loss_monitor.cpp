#include <gtest/gtest.h>
#include "core/stop_loss_monitor.hpp"
#include "market_data/market_adapters.hpp"
#include "fakes.hpp"

using namespace updown;
using namespace updown::testing_fakes;

class StopLossMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        exchange_ = std::make_shared<FakeExchange>();
        store_ = std::make_shared<InMemoryTradeStore>();
        settings_ = std::make_shared<SettingsManager>();
        engine_ = std::make_shared<ExecutionEngine>(exchange_, store_, [](std::chrono::milliseconds) {});
        monitor_ = std::make_unique<StopLossMonitor>(exchange_, engine_, store_, settings_);
    }

    Position position(const std::string& token, double price, double size = 95.0) {
        Position p;
        p.token_id = token;
        p.market_id = "cond-" + token;
        p.title = "Bitcoin Up or Down";
        p.outcome = "Up";
        p.size = size;
        p.avg_price = 0.94;
        p.current_price = price;
        exchange_->set_book(token, {{price, 500.0}}, {{price + 0.02, 500.0}});
        return p;
    }

    std::shared_ptr<FakeExchange> exchange_;
    std::shared_ptr<InMemoryTradeStore> store_;
    std::shared_ptr<SettingsManager> settings_;
    std::shared_ptr<ExecutionEngine> engine_;
    std::unique_ptr<StopLossMonitor> monitor_;
};

TEST_F(StopLossMonitorTest, SellsOnlyBelowThreshold) {
    exchange_->positions = {position("low", 0.65), position("ok", 0.75), position("edge", 0.70)};

    auto run = monitor_->check_once();

    EXPECT_EQ(run.status, ResultStatus::OK);
    EXPECT_EQ(run.summary.checked, 3);
    EXPECT_EQ(run.summary.sold, 1);
    ASSERT_EQ(exchange_->submitted.size(), 1u);
    EXPECT_EQ(exchange_->submitted[0].token_id, "low");
    EXPECT_EQ(exchange_->submitted[0].side, Side::SELL);
    EXPECT_DOUBLE_EQ(exchange_->submitted[0].price, 0.64);
}

TEST_F(StopLossMonitorTest, ResolvedAndEmptyPositionsIgnored) {
    auto resolved = position("resolved", 0.01);
    resolved.resolved = true;
    auto empty = position("empty", 0.10, 0.0);
    exchange_->positions = {resolved, empty};

    auto run = monitor_->check_once();
    EXPECT_EQ(run.summary.checked, 0);
    EXPECT_TRUE(exchange_->submitted.empty());
}

TEST_F(StopLossMonitorTest, UnpricedPosition_NeverSold) {
    auto unpriced = position("unpriced", 0.0);
    exchange_->set_book("unpriced", {{0.90, 500.0}}, {{0.92, 500.0}});
    exchange_->positions = {unpriced};

    auto run = monitor_->check_once();
    EXPECT_EQ(run.status, ResultStatus::OK);
    EXPECT_EQ(run.summary.checked, 0);
    EXPECT_EQ(run.summary.sold, 0);
    EXPECT_TRUE(exchange_->submitted.empty());
}

TEST_F(StopLossMonitorTest, UnpricedDataApiEntry_NeverSold) {
    exchange_->positions = adapters::parse_positions(nlohmann::json::parse(R"([{"asset": "tok", "size": 95}])"));
    exchange_->set_book("tok", {{0.90, 500.0}}, {{0.92, 500.0}});

    monitor_->check_once();
    EXPECT_TRUE(exchange_->submitted.empty());
}

TEST_F(StopLossMonitorTest, ThresholdInCents) {
    settings_->update({{"stop_loss", {{"threshold", 60}}}});
    exchange_->positions = {position("p", 0.65)};

    EXPECT_EQ(monitor_->check_once().summary.sold, 0);
}

TEST_F(StopLossMonitorTest, Disabled_LoopSkipsManualRuns) {
    settings_->update({{"stop_loss", {{"enabled", false}}}});
    exchange_->positions = {position("low", 0.50)};

    auto loop = monitor_->check_once();
    EXPECT_EQ(loop.status, ResultStatus::SKIPPED);
    EXPECT_EQ(loop.message, "Stop-loss disabled");
    EXPECT_TRUE(exchange_->submitted.empty());

    auto manual = monitor_->check_now();
    EXPECT_EQ(manual.status, ResultStatus::OK);
    EXPECT_EQ(manual.summary.sold, 1);
}

TEST_F(StopLossMonitorTest, ClosesMatchingTradeWithPnl) {
    Trade t;
    t.id = "t1";
    t.market_id = "cond-low";
    t.token_id = "low";
    t.side = Outcome::UP;
    t.size = 95.0;
    t.cost = 89.30;
    t.status = TradeStatus::OPEN;
    store_->save(t);
    exchange_->positions = {position("low", 0.65)};

    monitor_->check_once();

    auto closed = store_->get_trade("t1");
    EXPECT_EQ(closed->status, TradeStatus::RESOLVED);
    ASSERT_TRUE(closed->pnl.has_value());
    EXPECT_NEAR(*closed->pnl, 0.64 * 95.0 - 89.30, 1e-9);
    EXPECT_EQ(closed->note, "stop-loss at 0.64");
}

TEST_F(StopLossMonitorTest, PartialSale_KeepsRemainderOpenWithProRataPnl) {
    Trade t;
    t.id = "t1";
    t.market_id = "cond-low";
    t.token_id = "low";
    t.side = Outcome::UP;
    t.size = 95.0;
    t.cost = 89.30;
    t.status = TradeStatus::OPEN;
    store_->save(t);
    exchange_->positions = {position("low", 0.65)};
    OrderAck fill = exchange_->default_ack;
    fill.filled_shares = 40.0;
    exchange_->acks = {fill};

    auto run = monitor_->check_once();
    EXPECT_EQ(run.summary.sold, 1);

    auto kept = store_->get_trade("t1");
    EXPECT_EQ(kept->status, TradeStatus::PARTIAL);
    EXPECT_DOUBLE_EQ(kept->size, 55.0);
    EXPECT_NEAR(kept->cost, 89.30 * 55.0 / 95.0, 1e-9);
    ASSERT_TRUE(kept->pnl.has_value());
    EXPECT_NEAR(*kept->pnl, 0.64 * 40.0 - 89.30 * 40.0 / 95.0, 1e-9);
    EXPECT_EQ(kept->note, "stop-loss sold 40 at 0.64");
    EXPECT_TRUE(store_->find_open_trade_by_market("cond-low").has_value());
}

TEST_F(StopLossMonitorTest, SellFailure_FailsRun) {
    auto p = position("low", 0.65);
    exchange_->books.erase("low");
    exchange_->positions = {p};

    auto run = monitor_->check_once();
    EXPECT_EQ(run.status, ResultStatus::FAILED);
    EXPECT_EQ(run.summary.failed, 1);
    EXPECT_EQ(run.message, "1 stop-loss sells failed");
}

TEST_F(StopLossMonitorTest, PositionsUnavailable_Fails) {
    exchange_->positions_fail = true;

    auto run = monitor_->check_once();
    EXPECT_EQ(run.status, ResultStatus::FAILED);
    EXPECT_EQ(run.message.rfind("Failed to fetch positions", 0), 0u);
    EXPECT_FALSE(monitor_->is_running());
}
