#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "market_data/order_book.hpp"

namespace updown {
namespace order_math {

constexpr int64_t MIN_PRICE_CENTS = 1;
constexpr int64_t MAX_PRICE_CENTS = 99;

/**
 * Exchange-precise order size. Everything is integer cents, so
 * price x shares has at most two decimals by construction.
 */
struct OrderSizing {
    int64_t price_cents{0};
    int64_t shares{0};
    int64_t notional_cents{0};

    Price price() const { return static_cast<double>(price_cents) / 100.0; }
    Notional notional() const { return static_cast<double>(notional_cents) / 100.0; }
    bool tradable() const { return shares >= 1; }
};

int64_t to_cents(double value);

// Best ask nudged up one tick, clamped to [0.01, 0.99]; nullopt without asks
std::optional<Price> marketable_buy_price(const OrderBook& book);

// Best bid nudged down one tick, clamped to [0.01, 0.99]; nullopt without bids
std::optional<Price> marketable_sell_price(const OrderBook& book);

// shares = floor(spend_cents / price_cents)
OrderSizing size_for_spend(Price price, Notional spend);

// Whole shares only, rounded down
OrderSizing size_for_shares(Price price, Size shares);

} // namespace order_math
} // namespace updown
