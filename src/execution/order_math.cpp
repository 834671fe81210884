#include "execution/order_math.hpp"
#include <algorithm>
#include <cmath>

namespace updown {
namespace order_math {

namespace {
    int64_t clamp_cents(int64_t cents) {
        return std::clamp(cents, MIN_PRICE_CENTS, MAX_PRICE_CENTS);
    }

    int64_t tick_cents(const OrderBook& book) {
        return std::max<int64_t>(1, to_cents(book.tick_size()));
    }
}

int64_t to_cents(double value) {
    return static_cast<int64_t>(std::llround(value * 100.0));
}

std::optional<Price> marketable_buy_price(const OrderBook& book) {
    auto ask = book.best_ask();
    if (!ask) return std::nullopt;
    return static_cast<double>(clamp_cents(to_cents(ask->price) + tick_cents(book))) / 100.0;
}

std::optional<Price> marketable_sell_price(const OrderBook& book) {
    auto bid = book.best_bid();
    if (!bid) return std::nullopt;
    return static_cast<double>(clamp_cents(to_cents(bid->price) - tick_cents(book))) / 100.0;
}

OrderSizing size_for_spend(Price price, Notional spend) {
    OrderSizing s;
    s.price_cents = clamp_cents(to_cents(price));
    int64_t spend_cents = static_cast<int64_t>(std::floor(spend * 100.0 + 1e-6));
    if (spend_cents <= 0) return s;

    s.shares = spend_cents / s.price_cents;
    s.notional_cents = s.price_cents * s.shares;
    return s;
}

OrderSizing size_for_shares(Price price, Size shares) {
    OrderSizing s;
    s.price_cents = clamp_cents(to_cents(price));
    s.shares = shares > 0.0 ? static_cast<int64_t>(std::floor(shares + 1e-9)) : 0;
    s.notional_cents = s.price_cents * s.shares;
    return s;
}

} // namespace order_math
} // namespace updown
