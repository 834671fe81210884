#include "market_data/order_book.hpp"
#include <algorithm>

namespace updown {

namespace {
    template <typename Levels>
    std::vector<PriceLevel> take_levels(const Levels& levels, int n) {
        std::vector<PriceLevel> result;
        for (const auto& [price, size] : levels) {
            if (static_cast<int>(result.size()) >= n) break;
            result.push_back({price, size});
        }
        return result;
    }

    template <typename Levels>
    Size sum_levels(const Levels& levels, int n) {
        Size total = 0.0;
        int count = 0;
        for (const auto& [price, size] : levels) {
            if (count++ >= n) break;
            total += size;
        }
        return total;
    }
}

OrderBook::OrderBook(const std::string& token_id)
    : token_id_(token_id) {}

void OrderBook::update_bid(Price price, Size size) {
    if (size <= 0.0) {
        bids_.erase(price);
    } else {
        bids_[price] = size;
    }
}

void OrderBook::update_ask(Price price, Size size) {
    if (size <= 0.0) {
        asks_.erase(price);
    } else {
        asks_[price] = size;
    }
}

void OrderBook::clear() {
    bids_.clear();
    asks_.clear();
}

void OrderBook::apply_snapshot(const std::vector<PriceLevel>& bids,
                               const std::vector<PriceLevel>& asks) {
    clear();
    for (const auto& level : bids) {
        if (level.price > 0.0 && level.size > 0.0) {
            bids_[level.price] = level.size;
        }
    }
    for (const auto& level : asks) {
        if (level.price > 0.0 && level.size > 0.0) {
            asks_[level.price] = level.size;
        }
    }
}

std::optional<PriceLevel> OrderBook::best_bid() const {
    if (bids_.empty()) return std::nullopt;
    auto it = bids_.begin();
    return PriceLevel{it->first, it->second};
}

std::optional<PriceLevel> OrderBook::best_ask() const {
    if (asks_.empty()) return std::nullopt;
    auto it = asks_.begin();
    return PriceLevel{it->first, it->second};
}

Price OrderBook::mid_price() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (!bid || !ask) return 0.0;
    return (bid->price + ask->price) / 2.0;
}

Price OrderBook::spread() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (!bid || !ask) return 0.0;
    return ask->price - bid->price;
}

double OrderBook::spread_cents() const {
    if (bids_.empty() || asks_.empty()) return 100.0;
    return spread() * 100.0;
}

Price OrderBook::quote_price() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (bid && ask) return (bid->price + ask->price) / 2.0;
    if (ask) return ask->price;
    if (bid) return bid->price;
    return 0.0;
}

std::vector<PriceLevel> OrderBook::top_bids(int n) const {
    return take_levels(bids_, n);
}

std::vector<PriceLevel> OrderBook::top_asks(int n) const {
    return take_levels(asks_, n);
}

Size OrderBook::bid_depth(int levels) const {
    return sum_levels(bids_, levels);
}

Size OrderBook::ask_depth(int levels) const {
    return sum_levels(asks_, levels);
}

} // namespace updown
