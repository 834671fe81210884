#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include "common/types.hpp"
#include "exchange/exchange_client.hpp"
#include "persistence/trade_store.hpp"
#include "execution/order_math.hpp"

namespace updown {

struct SubmitResult {
    ResultStatus status{ResultStatus::FAILED};
    std::optional<Trade> trade;
    std::string reason;
    Price price{0.0};
    Size shares{0.0};
};

/**
 * Turns opportunities into trades. Every submission re-checks the store
 * for an active trade on the same market before touching the broker.
 */
class ExecutionEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ExecutionEngine(std::shared_ptr<ExchangeClient> exchange,
                    std::shared_ptr<TradeStore> store,
                    Sleeper sleeper = nullptr);

    SubmitResult submit(const Opportunity& opp);

    // Sequential, with a pause between orders
    std::vector<SubmitResult> submit_all(const std::vector<Opportunity>& opps, int order_delay_ms);

    // Two-leg buy on one market; a failed second leg cancels the first
    SubmitResult submit_straddle(const Opportunity& leg_a, const Opportunity& leg_b);

    // Market sell of the full position (stop-loss)
    SubmitResult sell_position(const Position& position);

    bool cancel_trade(const std::string& trade_id);

    bool is_read_only() const { return exchange_->is_read_only(); }

private:
    std::shared_ptr<ExchangeClient> exchange_;
    std::shared_ptr<TradeStore> store_;
    Sleeper sleeper_;

    struct LegFill {
        bool ok{false};
        bool partial{false};
        std::string order_id;
        order_math::OrderSizing sizing;
        std::string error;
    };

    LegFill place_buy(const std::string& token_id, Notional spend, bool neg_risk);

    std::optional<SubmitResult> reject_duplicate(const std::string& market_id);
    Trade new_trade(const Opportunity& opp) const;
    SubmitResult fail(Trade& trade, const std::string& reason);
    void cancel_leg(const std::string& order_id);
};

} // namespace updown
