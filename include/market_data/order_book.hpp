#pragma once

#include <map>
#include <vector>
#include <optional>
#include <string>
#include "common/types.hpp"

namespace updown {

/**
 * Point-in-time order book for one outcome token, built from a CLOB
 * REST snapshot. Levels are kept sorted regardless of upstream order.
 */
class OrderBook {
public:
    OrderBook() = default;
    explicit OrderBook(const std::string& token_id);

    // Update methods
    void update_bid(Price price, Size size);
    void update_ask(Price price, Size size);
    void clear();

    // Full snapshot update
    void apply_snapshot(const std::vector<PriceLevel>& bids,
                        const std::vector<PriceLevel>& asks);

    // Query methods
    std::optional<PriceLevel> best_bid() const;
    std::optional<PriceLevel> best_ask() const;
    Price mid_price() const;
    Price spread() const;

    /**
     * Spread in cents; a book missing either side counts as 100 cents
     * so it always reads as wide.
     */
    double spread_cents() const;

    /**
     * Display/decision price: mid when both sides exist, else best ask,
     * else best bid, else 0 (no liquidity).
     */
    Price quote_price() const;

    std::vector<PriceLevel> top_bids(int n) const;
    std::vector<PriceLevel> top_asks(int n) const;

    Size bid_depth(int levels) const;
    Size ask_depth(int levels) const;

    bool empty() const { return bids_.empty() && asks_.empty(); }

    const std::string& token_id() const { return token_id_; }

    // Minimum price increment reported by the exchange
    Price tick_size() const { return tick_size_; }
    void set_tick_size(Price tick) { tick_size_ = tick; }

    bool neg_risk() const { return neg_risk_; }
    void set_neg_risk(bool v) { neg_risk_ = v; }

private:
    std::string token_id_;
    Price tick_size_{0.01};
    bool neg_risk_{false};

    // Bids sorted descending (highest first)
    std::map<Price, Size, std::greater<Price>> bids_;
    // Asks sorted ascending (lowest first)
    std::map<Price, Size> asks_;
};

} // namespace updown
