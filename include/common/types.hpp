#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <vector>
#include <cstdint>

namespace updown {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

// Injectable wall clock, the scheduler and gates read time only through this
using ClockFn = std::function<WallClock()>;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Probability price in (0, 1], 1.0 = $1.00 payout
using Price = double;
using Size = double;
using Notional = double;

// Side enum
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

// Which outcome of a binary up/down market
enum class Outcome {
    UP,    // side A
    DOWN   // side B
};

inline std::string outcome_to_string(Outcome o) {
    return o == Outcome::UP ? "up" : "down";
}

inline Outcome outcome_from_string(const std::string& s) {
    return (s == "down" || s == "DOWN" || s == "Down" || s == "no") ? Outcome::DOWN : Outcome::UP;
}

// Exchange time-in-force
enum class OrderType {
    GTC,  // Good Till Cancel
    FOK,  // Fill or Kill
    FAK   // Fill and Kill (immediate or cancel)
};

inline std::string order_type_to_string(OrderType t) {
    switch (t) {
        case OrderType::GTC: return "GTC";
        case OrderType::FOK: return "FOK";
        case OrderType::FAK: return "FAK";
    }
    return "UNKNOWN";
}

// Trade lifecycle
enum class TradeStatus {
    PENDING,
    PARTIAL,
    OPEN,
    RESOLVED,
    FAILED,
    CANCELLED
};

inline std::string trade_status_to_string(TradeStatus s) {
    switch (s) {
        case TradeStatus::PENDING: return "pending";
        case TradeStatus::PARTIAL: return "partial";
        case TradeStatus::OPEN: return "open";
        case TradeStatus::RESOLVED: return "resolved";
        case TradeStatus::FAILED: return "failed";
        case TradeStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline TradeStatus trade_status_from_string(const std::string& s) {
    if (s == "partial") return TradeStatus::PARTIAL;
    if (s == "open") return TradeStatus::OPEN;
    if (s == "resolved") return TradeStatus::RESOLVED;
    if (s == "failed") return TradeStatus::FAILED;
    if (s == "cancelled") return TradeStatus::CANCELLED;
    return TradeStatus::PENDING;
}

// pending / partial / open block another trade on the same market
inline bool is_active_status(TradeStatus s) {
    return s == TradeStatus::PENDING || s == TradeStatus::PARTIAL || s == TradeStatus::OPEN;
}

// Outcome of a public operation
enum class ResultStatus {
    OK,
    SKIPPED,   // expected no-op
    FAILED     // unexpected failure
};

inline std::string result_status_to_string(ResultStatus s) {
    switch (s) {
        case ResultStatus::OK: return "ok";
        case ResultStatus::SKIPPED: return "skipped";
        case ResultStatus::FAILED: return "failed";
    }
    return "unknown";
}

// Price level in order book
struct PriceLevel {
    Price price{0.0};
    Size size{0.0};
};

// One side of a binary market
struct OutcomeQuote {
    std::string token_id;
    Price price{0.0};
};

/**
 * Two-sided quote for one up/down market, rebuilt every scan.
 */
struct MarketQuote {
    std::string asset_id;        // "btc", "eth", ...
    std::string market_id;       // condition id
    std::string event_id;
    std::string title;
    WallClock end_time{};
    OutcomeQuote side_a;         // Up
    OutcomeQuote side_b;         // Down
    double volume_usd{0.0};
    bool neg_risk{false};

    double hours_until_close(WallClock at) const {
        return std::chrono::duration<double>(end_time - at).count() / 3600.0;
    }
};

/**
 * Single-sided candidate trade inside the configured price band.
 */
struct Opportunity {
    MarketQuote quote;
    Outcome side{Outcome::UP};
    std::string token_id;
    Price price{0.0};
    Size size_shares{0.0};
    double expected_win_rate{0.0};
    double expected_value{0.0};
    double bet_size{0.0};
};

/**
 * Durable unit of execution, persisted by the trade store.
 */
struct Trade {
    std::string id;
    std::string market_id;
    std::string market_label;
    std::string asset_id;
    Outcome side{Outcome::UP};
    std::string token_id;
    std::string token_id_b;      // straddle second leg
    Price entry_price{0.0};
    Price entry_price_b{0.0};
    Size size{0.0};
    Size size_b{0.0};
    Notional cost{0.0};
    std::string order_id_a;
    std::string order_id_b;
    TradeStatus status{TradeStatus::PENDING};
    std::optional<double> pnl;
    int64_t created_at{0};       // epoch ms
    std::optional<int64_t> resolved_at;
    bool neg_risk{false};
    std::string note;
};

/**
 * Read-only position view polled from the exchange.
 */
struct Position {
    std::string token_id;
    std::string market_id;       // condition id, may be empty
    std::string title;
    std::string outcome;
    Size size{0.0};
    Price avg_price{0.0};
    Price current_price{0.0};
    bool resolved{false};
    bool neg_risk{false};
};

/**
 * A closed market from the historical series.
 */
struct ResolvedMarket {
    std::string asset_id;
    std::string market_id;       // condition id
    std::string title;
    WallClock resolved_at{};
    std::string token_id_a;
    std::string token_id_b;
    std::optional<Outcome> winner;
    bool neg_risk{false};
};

// Display snapshot entry per market
struct LiveMarketView {
    std::string event_id;
    std::string market_id;
    std::string title;
    Price up_price{0.0};
    Price down_price{0.0};
    Price combined_cost{0.0};
    double hours_left{0.0};
    bool is_viable{false};
    std::optional<Outcome> viable_side;
    double expected_value{0.0};
};

struct ScanSummary {
    int markets{0};
    int opportunities{0};
    int trades{0};
    int assets_failed{0};

    ScanSummary& operator+=(const ScanSummary& o) {
        markets += o.markets;
        opportunities += o.opportunities;
        trades += o.trades;
        assets_failed += o.assets_failed;
        return *this;
    }
};

struct ClaimSummary {
    int attempted{0};
    int success{0};
    int skipped{0};
    int failed{0};
    int trades_settled{0};
    std::vector<std::string> errors;
};

struct StopLossSummary {
    int checked{0};
    int sold{0};
    int failed{0};
};

} // namespace updown
