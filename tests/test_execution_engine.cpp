#include <gtest/gtest.h>
#include "execution/execution_engine.hpp"
#include "fakes.hpp"

using namespace updown;
using namespace updown::testing_fakes;

class ExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        exchange_ = std::make_shared<FakeExchange>();
        store_ = std::make_shared<InMemoryTradeStore>();
        engine_ = std::make_unique<ExecutionEngine>(exchange_, store_,
            [this](std::chrono::milliseconds d) { sleeps_.push_back(d.count()); });
    }

    Opportunity opp(const std::string& market_id, Price price, Outcome side = Outcome::UP) {
        Opportunity o;
        o.quote = make_quote(market_id, side == Outcome::UP ? price : 1.0 - price,
                             side == Outcome::UP ? 1.0 - price : price);
        o.side = side;
        o.token_id = side == Outcome::UP ? o.quote.side_a.token_id : o.quote.side_b.token_id;
        o.price = price;
        o.bet_size = 90.0;
        o.size_shares = 90.0 / price;
        o.expected_win_rate = 0.99;
        o.expected_value = (0.99 - price) * o.size_shares;
        return o;
    }

    std::shared_ptr<FakeExchange> exchange_;
    std::shared_ptr<InMemoryTradeStore> store_;
    std::unique_ptr<ExecutionEngine> engine_;
    std::vector<int64_t> sleeps_;
};

// ============================================================================
// Single-leg submission
// ============================================================================

TEST_F(ExecutionEngineTest, Submit_FillsAtOneTickAboveAsk) {
    exchange_->set_book("m1-up", {{0.91, 100.0}}, {{0.93, 100.0}});

    auto r = engine_->submit(opp("m1", 0.92));

    ASSERT_EQ(r.status, ResultStatus::OK);
    ASSERT_EQ(exchange_->submitted.size(), 1u);
    const auto& req = exchange_->submitted[0];
    EXPECT_EQ(req.token_id, "m1-up");
    EXPECT_EQ(req.side, Side::BUY);
    EXPECT_EQ(req.type, OrderType::FAK);
    EXPECT_DOUBLE_EQ(req.price, 0.94);
    EXPECT_DOUBLE_EQ(req.shares, 95.0);

    ASSERT_TRUE(r.trade.has_value());
    EXPECT_EQ(r.trade->status, TradeStatus::OPEN);
    EXPECT_EQ(r.trade->order_id_a, "order-1");
    EXPECT_DOUBLE_EQ(r.trade->entry_price, 0.94);
    EXPECT_DOUBLE_EQ(r.trade->cost, 89.30);

    auto stored = store_->get_trade(r.trade->id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, TradeStatus::OPEN);
}

TEST_F(ExecutionEngineTest, Submit_DuplicateMarketSkipsBroker) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    ASSERT_EQ(engine_->submit(opp("m1", 0.92)).status, ResultStatus::OK);

    auto again = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(again.status, ResultStatus::SKIPPED);
    EXPECT_NE(again.reason.find("Duplicate"), std::string::npos);
    EXPECT_EQ(exchange_->submitted.size(), 1u);
    EXPECT_EQ(store_->all().size(), 1u);
}

TEST_F(ExecutionEngineTest, Submit_ResolvedTradeDoesNotBlock) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    auto first = engine_->submit(opp("m1", 0.92));
    Trade t = *first.trade;
    t.status = TradeStatus::RESOLVED;
    store_->update(t);

    EXPECT_EQ(engine_->submit(opp("m1", 0.92)).status, ResultStatus::OK);
}

TEST_F(ExecutionEngineTest, ReadOnly_SimulatesWithoutBroker) {
    exchange_->read_only = true;

    auto r = engine_->submit(opp("m1", 0.92));

    ASSERT_EQ(r.status, ResultStatus::OK);
    EXPECT_TRUE(exchange_->submitted.empty());
    EXPECT_EQ(r.trade->status, TradeStatus::OPEN);
    EXPECT_EQ(r.trade->note, "simulated");
    EXPECT_EQ(r.trade->order_id_a.rfind("simulated-", 0), 0u);

    // Simulated trades still block the market
    EXPECT_EQ(engine_->submit(opp("m1", 0.92)).status, ResultStatus::SKIPPED);
}

TEST_F(ExecutionEngineTest, EmptyAsks_FailsWithoutOrder) {
    exchange_->set_book("m1-up", {{0.91, 100.0}}, {});

    auto r = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason, "No liquidity: empty ask side");
    EXPECT_TRUE(exchange_->submitted.empty());
    EXPECT_EQ(store_->get_trade(r.trade->id)->status, TradeStatus::FAILED);
}

TEST_F(ExecutionEngineTest, MissingBook_Fails) {
    auto r = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason.rfind("Order book unavailable", 0), 0u);
}

TEST_F(ExecutionEngineTest, TinyBet_TooSmall) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    auto o = opp("m1", 0.92);
    o.bet_size = 0.50;

    auto r = engine_->submit(o);
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason, "Order too small");
}

TEST_F(ExecutionEngineTest, RejectedOrder_Fails) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    OrderAck rejected;
    rejected.error = "invalid signature";
    exchange_->acks.push_back(rejected);

    auto r = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason, "invalid signature");
    EXPECT_EQ(r.trade->note, "invalid signature");
}

TEST_F(ExecutionEngineTest, InsufficientFunds_IsLabelled) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    OrderAck rejected;
    rejected.error = "not enough balance / allowance";
    rejected.insufficient_funds = true;
    exchange_->acks.push_back(rejected);

    auto r = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason.rfind("Insufficient USDC balance", 0), 0u);
}

TEST_F(ExecutionEngineTest, UnmatchedOrder_NotFilled) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    OrderAck unmatched;
    unmatched.accepted = true;
    unmatched.order_id = "order-9";
    unmatched.status = "unmatched";
    exchange_->acks.push_back(unmatched);

    auto r = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason, "Order not filled");
    EXPECT_EQ(r.trade->order_id_a, "order-9");
}

TEST_F(ExecutionEngineTest, PartialFill_RecordsFilledShares) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    OrderAck partial;
    partial.accepted = true;
    partial.order_id = "order-2";
    partial.status = "matched";
    partial.filled_shares = 40.0;
    exchange_->acks.push_back(partial);

    auto r = engine_->submit(opp("m1", 0.92));
    ASSERT_EQ(r.status, ResultStatus::OK);
    EXPECT_EQ(r.trade->status, TradeStatus::PARTIAL);
    EXPECT_DOUBLE_EQ(r.trade->size, 40.0);
    EXPECT_DOUBLE_EQ(r.trade->cost, 37.60);
}

TEST_F(ExecutionEngineTest, StoreFailure_NoOrderPlaced) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    store_->fail_saves = true;

    auto r = engine_->submit(opp("m1", 0.92));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason.rfind("Store error", 0), 0u);
    EXPECT_TRUE(exchange_->submitted.empty());
}

TEST_F(ExecutionEngineTest, SubmitAll_PausesBetweenOrders) {
    exchange_->set_book("a-up", {}, {{0.93, 100.0}});
    exchange_->set_book("b-up", {}, {{0.91, 100.0}});
    exchange_->set_book("c-up", {}, {{0.92, 100.0}});

    auto results = engine_->submit_all({opp("a", 0.92), opp("b", 0.90), opp("c", 0.91)}, 500);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) EXPECT_EQ(r.status, ResultStatus::OK);
    EXPECT_EQ(sleeps_, (std::vector<int64_t>{500, 500}));
}

// ============================================================================
// Straddle
// ============================================================================

TEST_F(ExecutionEngineTest, Straddle_BothLegsFill) {
    exchange_->set_book("m1-up", {}, {{0.48, 100.0}});
    exchange_->set_book("m1-down", {}, {{0.49, 100.0}});
    OrderAck a = exchange_->default_ack;
    a.order_id = "leg-a";
    OrderAck b = exchange_->default_ack;
    b.order_id = "leg-b";
    exchange_->acks = {a, b};

    auto r = engine_->submit_straddle(opp("m1", 0.48), opp("m1", 0.49, Outcome::DOWN));
    ASSERT_EQ(r.status, ResultStatus::OK);
    EXPECT_EQ(r.trade->order_id_a, "leg-a");
    EXPECT_EQ(r.trade->order_id_b, "leg-b");
    EXPECT_EQ(r.trade->status, TradeStatus::OPEN);
    EXPECT_TRUE(exchange_->cancelled.empty());
}

TEST_F(ExecutionEngineTest, Straddle_SecondLegFailureCancelsFirst) {
    exchange_->set_book("m1-up", {}, {{0.48, 100.0}});
    exchange_->set_book("m1-down", {}, {});
    OrderAck a = exchange_->default_ack;
    a.order_id = "leg-a";
    exchange_->acks = {a};

    auto r = engine_->submit_straddle(opp("m1", 0.48), opp("m1", 0.49, Outcome::DOWN));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason.rfind("Leg B:", 0), 0u);
    EXPECT_EQ(exchange_->cancelled, (std::vector<std::string>{"leg-a"}));
}

TEST_F(ExecutionEngineTest, Straddle_SecondLegThrows_CancelsFirstAndFails) {
    exchange_->set_book("m1-up", {}, {{0.48, 100.0}});
    exchange_->set_book("m1-down", {}, {{0.49, 100.0}});
    OrderAck a = exchange_->default_ack;
    a.order_id = "leg-a";
    exchange_->acks = {a};
    exchange_->throw_on_submit = 2;

    auto r = engine_->submit_straddle(opp("m1", 0.48), opp("m1", 0.49, Outcome::DOWN));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason, "Leg B: signing failed for token m1-down");
    EXPECT_EQ(exchange_->cancelled, (std::vector<std::string>{"leg-a"}));

    ASSERT_EQ(store_->all().size(), 1u);
    EXPECT_EQ(store_->all()[0].status, TradeStatus::FAILED);
    EXPECT_FALSE(store_->find_open_trade_by_market("m1").has_value());
}

TEST_F(ExecutionEngineTest, Straddle_FirstLegThrows_NothingToCancel) {
    exchange_->set_book("m1-up", {}, {{0.48, 100.0}});
    exchange_->set_book("m1-down", {}, {{0.49, 100.0}});
    exchange_->throw_on_submit = 1;

    auto r = engine_->submit_straddle(opp("m1", 0.48), opp("m1", 0.49, Outcome::DOWN));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason.rfind("Leg A:", 0), 0u);
    EXPECT_TRUE(exchange_->cancelled.empty());
    EXPECT_EQ(store_->all()[0].status, TradeStatus::FAILED);
}

TEST_F(ExecutionEngineTest, Straddle_LegsMustShareMarket) {
    auto r = engine_->submit_straddle(opp("m1", 0.48), opp("m2", 0.49, Outcome::DOWN));
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_TRUE(store_->all().empty());
}

// ============================================================================
// Sell and cancel
// ============================================================================

TEST_F(ExecutionEngineTest, SellPosition_CrossesBestBid) {
    exchange_->set_book("tok", {{0.65, 200.0}}, {{0.70, 200.0}});
    Position p;
    p.token_id = "tok";
    p.size = 97.6;
    p.current_price = 0.66;

    auto r = engine_->sell_position(p);
    ASSERT_EQ(r.status, ResultStatus::OK);
    ASSERT_EQ(exchange_->submitted.size(), 1u);
    EXPECT_EQ(exchange_->submitted[0].side, Side::SELL);
    EXPECT_DOUBLE_EQ(exchange_->submitted[0].price, 0.64);
    EXPECT_DOUBLE_EQ(exchange_->submitted[0].shares, 97.0);
    EXPECT_DOUBLE_EQ(r.price, 0.64);
}

TEST_F(ExecutionEngineTest, SellPosition_NoBids) {
    exchange_->set_book("tok", {}, {{0.70, 200.0}});
    Position p;
    p.token_id = "tok";
    p.size = 10.0;

    auto r = engine_->sell_position(p);
    EXPECT_EQ(r.status, ResultStatus::FAILED);
    EXPECT_EQ(r.reason, "No liquidity: empty bid side");
}

TEST_F(ExecutionEngineTest, CancelTrade_CancelsOrdersAndMarksCancelled) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    auto r = engine_->submit(opp("m1", 0.92));

    EXPECT_TRUE(engine_->cancel_trade(r.trade->id));
    EXPECT_EQ(exchange_->cancelled, (std::vector<std::string>{"order-1"}));
    EXPECT_EQ(store_->get_trade(r.trade->id)->status, TradeStatus::CANCELLED);

    // Already cancelled
    EXPECT_FALSE(engine_->cancel_trade(r.trade->id));
    EXPECT_FALSE(engine_->cancel_trade("missing"));
}

TEST_F(ExecutionEngineTest, CancelTrade_BrokerRefusalKeepsTrade) {
    exchange_->set_book("m1-up", {}, {{0.93, 100.0}});
    auto r = engine_->submit(opp("m1", 0.92));
    exchange_->cancel_ok = false;

    EXPECT_FALSE(engine_->cancel_trade(r.trade->id));
    EXPECT_EQ(store_->get_trade(r.trade->id)->status, TradeStatus::OPEN);
}
