#include "execution/execution_engine.hpp"
#include "utils/uuid.hpp"
#include <thread>
#include <spdlog/spdlog.h>

namespace updown {

namespace {
    const char* SIMULATED_PREFIX = "simulated-";

    bool is_simulated(const std::string& order_id) {
        return order_id.rfind(SIMULATED_PREFIX, 0) == 0;
    }
}

ExecutionEngine::ExecutionEngine(std::shared_ptr<ExchangeClient> exchange,
                                 std::shared_ptr<TradeStore> store,
                                 Sleeper sleeper)
    : exchange_(std::move(exchange))
    , store_(std::move(store))
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::optional<SubmitResult> ExecutionEngine::reject_duplicate(const std::string& market_id) {
    auto existing = store_->find_open_trade_by_market(market_id);
    if (!existing) return std::nullopt;

    spdlog::info("Skipping market {} - already have active trade {} ({})",
                 market_id, existing->id, trade_status_to_string(existing->status));
    SubmitResult r;
    r.status = ResultStatus::SKIPPED;
    r.reason = "Duplicate: trade " + existing->id + " already active";
    r.trade = existing;
    return r;
}

Trade ExecutionEngine::new_trade(const Opportunity& opp) const {
    Trade t;
    t.id = generate_uuid();
    t.market_id = opp.quote.market_id;
    t.market_label = opp.quote.title;
    t.asset_id = opp.quote.asset_id;
    t.side = opp.side;
    t.token_id = opp.token_id;
    t.entry_price = opp.price;
    t.size = opp.size_shares;
    t.cost = opp.price * opp.size_shares;
    t.status = TradeStatus::PENDING;
    t.created_at = now_ms();
    t.neg_risk = opp.quote.neg_risk;
    return t;
}

SubmitResult ExecutionEngine::fail(Trade& trade, const std::string& reason) {
    spdlog::error("Trade {} failed: {}", trade.id, reason);
    trade.status = TradeStatus::FAILED;
    trade.note = reason;
    try {
        store_->update(trade);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record failure of trade {}: {}", trade.id, e.what());
    }

    SubmitResult r;
    r.status = ResultStatus::FAILED;
    r.trade = trade;
    r.reason = reason;
    return r;
}

// A refused or failed cancel is logged, not retried
void ExecutionEngine::cancel_leg(const std::string& order_id) {
    try {
        auto cancel = exchange_->cancel_order(order_id);
        if (!cancel.success) {
            spdlog::error("Failed to cancel leg A order {}: {}", order_id, cancel.error);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to cancel leg A order {}: {}", order_id, e.what());
    }
}

ExecutionEngine::LegFill ExecutionEngine::place_buy(const std::string& token_id, Notional spend,
                                                    bool neg_risk) {
    LegFill leg;

    OrderBook book;
    try {
        book = exchange_->get_order_book(token_id);
    } catch (const std::exception& e) {
        leg.error = std::string("Order book unavailable: ") + e.what();
        return leg;
    }

    // The quote may have moved since evaluation; cross the current best ask
    auto price = order_math::marketable_buy_price(book);
    if (!price) {
        leg.error = "No liquidity: empty ask side";
        return leg;
    }

    leg.sizing = order_math::size_for_spend(*price, spend);
    if (!leg.sizing.tradable()) {
        leg.error = "Order too small";
        return leg;
    }

    OrderRequest req;
    req.token_id = token_id;
    req.side = Side::BUY;
    req.price = leg.sizing.price();
    req.shares = static_cast<double>(leg.sizing.shares);
    req.type = OrderType::FAK;
    req.neg_risk = neg_risk || book.neg_risk();

    auto ack = exchange_->submit_order(req);
    if (!ack.accepted) {
        leg.error = ack.insufficient_funds ? "Insufficient USDC balance: " + ack.error : ack.error;
        return leg;
    }
    if (ack.status == "unmatched") {
        leg.error = "Order not filled";
        leg.order_id = ack.order_id;
        return leg;
    }

    leg.ok = true;
    leg.order_id = ack.order_id;
    if (ack.filled_shares > 0.0 && ack.filled_shares + 1e-6 < req.shares) {
        leg.partial = true;
        leg.sizing = order_math::size_for_shares(req.price, ack.filled_shares);
    }
    return leg;
}

SubmitResult ExecutionEngine::submit(const Opportunity& opp) {
    if (auto dup = reject_duplicate(opp.quote.market_id)) {
        return *dup;
    }

    Trade trade = new_trade(opp);
    spdlog::info("=== EXECUTING TRADE {} ===", trade.id);
    spdlog::info("[{}] {} {} at {:.1f}c, {:.2f} shares, cost ${:.2f}",
                 trade.asset_id, trade.market_label, outcome_to_string(trade.side),
                 opp.price * 100, opp.size_shares, trade.cost);

    try {
        store_->save(trade);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save trade {}: {}", trade.id, e.what());
        SubmitResult r;
        r.reason = std::string("Store error: ") + e.what();
        return r;
    }

    if (exchange_->is_read_only()) {
        trade.status = TradeStatus::OPEN;
        trade.order_id_a = SIMULATED_PREFIX + trade.id;
        trade.note = "simulated";
        store_->update(trade);
        spdlog::warn("Read-only mode - simulated trade {}", trade.id);

        SubmitResult r;
        r.status = ResultStatus::OK;
        r.trade = trade;
        r.price = trade.entry_price;
        r.shares = trade.size;
        return r;
    }

    LegFill leg;
    try {
        leg = place_buy(trade.token_id, opp.bet_size, trade.neg_risk);
    } catch (const std::exception& e) {
        return fail(trade, e.what());
    }
    if (!leg.ok) {
        if (!leg.order_id.empty()) trade.order_id_a = leg.order_id;
        return fail(trade, leg.error);
    }

    trade.order_id_a = leg.order_id;
    trade.entry_price = leg.sizing.price();
    trade.size = static_cast<double>(leg.sizing.shares);
    trade.cost = leg.sizing.notional();
    trade.status = leg.partial ? TradeStatus::PARTIAL : TradeStatus::OPEN;
    store_->update(trade);

    spdlog::info("=== TRADE {} {} - order {} ({} shares at {:.2f}) ===",
                 trade.id, trade_status_to_string(trade.status), trade.order_id_a,
                 leg.sizing.shares, trade.entry_price);

    SubmitResult r;
    r.status = ResultStatus::OK;
    r.trade = trade;
    r.price = trade.entry_price;
    r.shares = trade.size;
    return r;
}

std::vector<SubmitResult> ExecutionEngine::submit_all(const std::vector<Opportunity>& opps,
                                                      int order_delay_ms) {
    std::vector<SubmitResult> results;
    for (size_t i = 0; i < opps.size(); i++) {
        try {
            results.push_back(submit(opps[i]));
        } catch (const std::exception& e) {
            spdlog::error("Error executing trade for {}: {}", opps[i].quote.title, e.what());
            SubmitResult r;
            r.reason = e.what();
            results.push_back(r);
        }

        if (i + 1 < opps.size() && order_delay_ms > 0) {
            sleeper_(std::chrono::milliseconds(order_delay_ms));
        }
    }
    return results;
}

SubmitResult ExecutionEngine::submit_straddle(const Opportunity& leg_a, const Opportunity& leg_b) {
    if (leg_a.quote.market_id != leg_b.quote.market_id) {
        SubmitResult r;
        r.reason = "Straddle legs must share a market";
        return r;
    }
    if (auto dup = reject_duplicate(leg_a.quote.market_id)) {
        return *dup;
    }

    Trade trade = new_trade(leg_a);
    trade.note = "straddle";
    trade.token_id_b = leg_b.token_id;
    trade.entry_price_b = leg_b.price;
    trade.size_b = leg_b.size_shares;
    trade.cost += leg_b.price * leg_b.size_shares;
    try {
        store_->save(trade);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save straddle {}: {}", trade.id, e.what());
        SubmitResult r;
        r.reason = std::string("Store error: ") + e.what();
        return r;
    }

    if (exchange_->is_read_only()) {
        trade.status = TradeStatus::OPEN;
        trade.order_id_a = SIMULATED_PREFIX + trade.id + "-a";
        trade.order_id_b = SIMULATED_PREFIX + trade.id + "-b";
        store_->update(trade);

        SubmitResult r;
        r.status = ResultStatus::OK;
        r.trade = trade;
        return r;
    }

    LegFill a;
    try {
        a = place_buy(leg_a.token_id, leg_a.bet_size, trade.neg_risk);
    } catch (const std::exception& e) {
        return fail(trade, std::string("Leg A: ") + e.what());
    }
    if (!a.ok) {
        return fail(trade, "Leg A: " + a.error);
    }
    trade.order_id_a = a.order_id;

    LegFill b;
    try {
        b = place_buy(leg_b.token_id, leg_b.bet_size, trade.neg_risk);
    } catch (const std::exception& e) {
        b.ok = false;
        b.error = e.what();
    }
    if (!b.ok) {
        cancel_leg(a.order_id);
        return fail(trade, "Leg B: " + b.error);
    }

    trade.order_id_b = b.order_id;
    trade.entry_price = a.sizing.price();
    trade.size = static_cast<double>(a.sizing.shares);
    trade.entry_price_b = b.sizing.price();
    trade.size_b = static_cast<double>(b.sizing.shares);
    trade.cost = a.sizing.notional() + b.sizing.notional();
    trade.status = (a.partial || b.partial) ? TradeStatus::PARTIAL : TradeStatus::OPEN;
    store_->update(trade);

    SubmitResult r;
    r.status = ResultStatus::OK;
    r.trade = trade;
    return r;
}

SubmitResult ExecutionEngine::sell_position(const Position& position) {
    SubmitResult r;

    if (exchange_->is_read_only()) {
        spdlog::warn("Read-only mode - simulated sell of {} shares of {}", position.size, position.token_id);
        r.status = ResultStatus::OK;
        r.price = position.current_price;
        r.shares = position.size;
        r.reason = "simulated";
        return r;
    }

    OrderBook book;
    try {
        book = exchange_->get_order_book(position.token_id);
    } catch (const std::exception& e) {
        r.reason = std::string("Order book unavailable: ") + e.what();
        return r;
    }

    auto price = order_math::marketable_sell_price(book);
    if (!price) {
        r.reason = "No liquidity: empty bid side";
        return r;
    }

    auto sizing = order_math::size_for_shares(*price, position.size);
    if (!sizing.tradable()) {
        r.reason = "Order too small";
        return r;
    }

    OrderRequest req;
    req.token_id = position.token_id;
    req.side = Side::SELL;
    req.price = sizing.price();
    req.shares = static_cast<double>(sizing.shares);
    req.type = OrderType::FAK;
    req.neg_risk = position.neg_risk || book.neg_risk();

    auto ack = exchange_->submit_order(req);
    if (!ack.accepted) {
        r.reason = ack.error;
        return r;
    }

    r.status = ResultStatus::OK;
    r.price = req.price;
    r.shares = ack.filled_shares > 0.0 ? ack.filled_shares : req.shares;
    r.reason = ack.order_id;
    spdlog::info("Sold {:.0f} shares of {} at {:.2f} (order {})", r.shares, position.token_id, r.price, ack.order_id);
    return r;
}

bool ExecutionEngine::cancel_trade(const std::string& trade_id) {
    auto trade = store_->get_trade(trade_id);
    if (!trade) {
        spdlog::error("Trade not found: {}", trade_id);
        return false;
    }
    if (trade->status != TradeStatus::OPEN && trade->status != TradeStatus::PARTIAL) {
        spdlog::warn("Cannot cancel trade in status: {}", trade_status_to_string(trade->status));
        return false;
    }

    if (!exchange_->is_read_only()) {
        for (const auto& order_id : {trade->order_id_a, trade->order_id_b}) {
            if (order_id.empty() || is_simulated(order_id)) continue;
            auto ack = exchange_->cancel_order(order_id);
            if (!ack.success) {
                spdlog::error("Failed to cancel trade {}: {}", trade_id, ack.error);
                return false;
            }
        }
    }

    trade->status = TradeStatus::CANCELLED;
    store_->update(*trade);
    spdlog::info("Trade cancelled: {}", trade_id);
    return true;
}

} // namespace updown
