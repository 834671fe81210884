#pragma once

#include <string>
#include <vector>
#include <optional>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market_data/order_book.hpp"
#include "exchange/exchange_client.hpp"

namespace updown {

// ============================================================================
// Tolerant parsing of upstream JSON into internal types.
//
// Gamma, CLOB and the Data API disagree on field names, encode arrays as
// JSON strings and numbers as decimal strings. Everything upstream-shaped
// is normalized here; anything unparsable yields nullopt and is dropped.
// ============================================================================

namespace adapters {

// Field helpers
std::optional<std::string> string_field(const nlohmann::json& j, std::initializer_list<const char*> keys);
std::optional<double> number_field(const nlohmann::json& j, std::initializer_list<const char*> keys);
std::optional<bool> bool_field(const nlohmann::json& j, std::initializer_list<const char*> keys);

// Accepts a JSON array or a string holding a JSON array
std::vector<std::string> string_list(const nlohmann::json& value);

// Accepts a number or a decimal string
std::optional<double> as_number(const nlohmann::json& value);

struct SeriesEvent {
    std::string id;
    std::string title;
    WallClock end_time{};
    bool closed{false};
};

std::vector<SeriesEvent> parse_series_events(const nlohmann::json& series);

// Markets embedded in a Gamma event document
std::vector<nlohmann::json> event_markets(const nlohmann::json& event);

/**
 * Up/down market from a Gamma market object. Prices are filled from the
 * books later; outcomePrices only seeds them. Requires both token ids.
 */
std::optional<MarketQuote> parse_market_quote(const nlohmann::json& market,
                                              const SeriesEvent& event,
                                              const std::string& asset_id);

/**
 * Closed market with its winner taken from outcomePrices (a side at > 0.9).
 */
std::optional<ResolvedMarket> parse_resolved_market(const nlohmann::json& market,
                                                    const SeriesEvent& event,
                                                    const std::string& asset_id);

std::optional<Position> parse_position(const nlohmann::json& j);
std::vector<Position> parse_positions(const nlohmann::json& j);

OrderBook parse_order_book(const std::string& token_id, const nlohmann::json& j);

// Filled shares come from takingAmount on buys and makingAmount on sells
OrderAck parse_order_ack(const nlohmann::json& j, Side side);

} // namespace adapters
} // namespace updown
