#include "market_data/market_adapters.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace updown {
namespace adapters {

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool is_up_name(const std::string& outcome) {
        auto o = lower(outcome);
        return o == "up" || o == "yes";
    }

    bool is_down_name(const std::string& outcome) {
        auto o = lower(outcome);
        return o == "down" || o == "no";
    }

    std::optional<WallClock> time_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
        auto s = string_field(j, keys);
        if (!s || s->empty()) return std::nullopt;
        try {
            return time_utils::from_iso8601(*s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::vector<PriceLevel> parse_levels(const nlohmann::json& levels) {
        std::vector<PriceLevel> out;
        if (!levels.is_array()) return out;
        for (const auto& level : levels) {
            auto price = number_field(level, {"price", "p"});
            auto size = number_field(level, {"size", "s"});
            if (price && size) {
                out.push_back({*price, *size});
            }
        }
        return out;
    }
}

std::optional<std::string> string_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (it->is_string()) return it->get<std::string>();
        if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
        if (it->is_number()) return it->dump();
    }
    return std::nullopt;
}

std::optional<double> as_number(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        try {
            size_t used = 0;
            double v = std::stod(s, &used);
            if (used == s.size()) return v;
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

std::optional<double> number_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (auto v = as_number(*it)) return v;
    }
    return std::nullopt;
}

std::optional<bool> bool_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (it->is_boolean()) return it->get<bool>();
        if (it->is_string()) {
            auto s = lower(it->get<std::string>());
            if (s == "true") return true;
            if (s == "false") return false;
        }
        if (it->is_number()) return it->get<double>() != 0.0;
    }
    return std::nullopt;
}

std::vector<std::string> string_list(const nlohmann::json& value) {
    nlohmann::json arr = value;
    if (value.is_string()) {
        arr = nlohmann::json::parse(value.get<std::string>(), nullptr, false);
    }
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& item : arr) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_number()) {
            out.push_back(item.dump());
        }
    }
    return out;
}

std::vector<SeriesEvent> parse_series_events(const nlohmann::json& series) {
    std::vector<SeriesEvent> out;
    const nlohmann::json* events = &series;
    if (series.is_object()) {
        auto it = series.find("events");
        if (it == series.end()) return out;
        events = &*it;
    }
    if (!events->is_array()) return out;

    for (const auto& e : *events) {
        auto id = string_field(e, {"id", "eventId", "event_id"});
        auto end = time_field(e, {"endDate", "end_date", "endDateIso", "end_date_iso"});
        if (!id || !end) continue;

        SeriesEvent ev;
        ev.id = *id;
        ev.title = string_field(e, {"title", "question", "slug"}).value_or("");
        ev.end_time = *end;
        ev.closed = bool_field(e, {"closed"}).value_or(false);
        out.push_back(ev);
    }
    return out;
}

std::vector<nlohmann::json> event_markets(const nlohmann::json& event) {
    std::vector<nlohmann::json> out;
    if (!event.is_object()) return out;
    auto it = event.find("markets");
    if (it == event.end() || !it->is_array()) return out;
    for (const auto& m : *it) {
        if (m.is_object()) out.push_back(m);
    }
    return out;
}

std::optional<MarketQuote> parse_market_quote(const nlohmann::json& market,
                                              const SeriesEvent& event,
                                              const std::string& asset_id) {
    auto condition_id = string_field(market, {"conditionId", "condition_id"});
    if (!condition_id || condition_id->empty()) return std::nullopt;

    MarketQuote q;
    q.asset_id = asset_id;
    q.market_id = *condition_id;
    q.event_id = event.id;
    q.title = string_field(market, {"question", "title"}).value_or(event.title);
    q.end_time = time_field(market, {"endDate", "end_date_iso", "endDateIso"}).value_or(event.end_time);
    q.neg_risk = bool_field(market, {"negRisk", "neg_risk"}).value_or(false);
    q.volume_usd = number_field(market, {"volumeNum", "volume", "volume24hr"}).value_or(0.0);

    if (market.contains("clobTokenIds")) {
        auto tokens = string_list(market["clobTokenIds"]);
        auto outcomes = market.contains("outcomes") ? string_list(market["outcomes"]) : std::vector<std::string>{};
        auto prices = market.contains("outcomePrices") ? string_list(market["outcomePrices"]) : std::vector<std::string>{};
        if (tokens.size() != 2) return std::nullopt;

        // Gamma lists Up first; honour explicit outcome names when they say otherwise
        size_t up = 0;
        size_t down = 1;
        if (outcomes.size() == 2 && is_down_name(outcomes[0]) && is_up_name(outcomes[1])) {
            up = 1;
            down = 0;
        }
        q.side_a.token_id = tokens[up];
        q.side_b.token_id = tokens[down];
        if (prices.size() == 2) {
            q.side_a.price = as_number(prices[up]).value_or(0.0);
            q.side_b.price = as_number(prices[down]).value_or(0.0);
        }
    } else if (market.contains("tokens") && market["tokens"].is_array()) {
        for (const auto& token : market["tokens"]) {
            auto outcome = string_field(token, {"outcome", "name"}).value_or("");
            auto token_id = string_field(token, {"token_id", "tokenId", "id"});
            if (!token_id) continue;
            double price = number_field(token, {"price"}).value_or(0.0);
            if (is_up_name(outcome)) {
                q.side_a = {*token_id, price};
            } else if (is_down_name(outcome)) {
                q.side_b = {*token_id, price};
            }
        }
    }

    if (q.side_a.token_id.empty() || q.side_b.token_id.empty()) return std::nullopt;
    return q;
}

std::optional<ResolvedMarket> parse_resolved_market(const nlohmann::json& market,
                                                    const SeriesEvent& event,
                                                    const std::string& asset_id) {
    auto quote = parse_market_quote(market, event, asset_id);
    if (!quote) return std::nullopt;

    ResolvedMarket r;
    r.asset_id = asset_id;
    r.market_id = quote->market_id;
    r.title = quote->title;
    r.resolved_at = quote->end_time;
    r.token_id_a = quote->side_a.token_id;
    r.token_id_b = quote->side_b.token_id;
    r.neg_risk = quote->neg_risk;

    if (quote->side_a.price > 0.9) {
        r.winner = Outcome::UP;
    } else if (quote->side_b.price > 0.9) {
        r.winner = Outcome::DOWN;
    }
    return r;
}

std::optional<Position> parse_position(const nlohmann::json& j) {
    auto token_id = string_field(j, {"asset", "token_id", "tokenId", "asset_id"});
    if (!token_id || token_id->empty()) return std::nullopt;

    // A position without a mark cannot be compared against the stop-loss
    auto current_price = number_field(j, {"curPrice", "currentPrice", "cur_price", "price"});
    if (!current_price) return std::nullopt;

    Position p;
    p.token_id = *token_id;
    p.market_id = string_field(j, {"conditionId", "condition_id", "market"}).value_or("");
    p.title = string_field(j, {"title", "question"}).value_or("");
    p.outcome = string_field(j, {"outcome"}).value_or("");
    p.size = number_field(j, {"size", "shares", "balance"}).value_or(0.0);
    p.avg_price = number_field(j, {"avgPrice", "avg_price", "averagePrice"}).value_or(0.0);
    p.current_price = *current_price;
    p.resolved = bool_field(j, {"redeemable", "resolved", "closed"}).value_or(false);
    p.neg_risk = bool_field(j, {"negativeRisk", "negRisk", "neg_risk"}).value_or(false);
    return p;
}

std::vector<Position> parse_positions(const nlohmann::json& j) {
    const nlohmann::json* list = &j;
    if (j.is_object()) {
        for (const char* key : {"positions", "data"}) {
            auto it = j.find(key);
            if (it != j.end() && it->is_array()) {
                list = &*it;
                break;
            }
        }
    }

    std::vector<Position> out;
    if (!list->is_array()) return out;
    for (const auto& item : *list) {
        if (auto p = parse_position(item)) {
            out.push_back(*p);
        } else {
            spdlog::debug("Dropping unparsable position entry");
        }
    }
    return out;
}

OrderBook parse_order_book(const std::string& token_id, const nlohmann::json& j) {
    OrderBook book(token_id);
    if (!j.is_object()) return book;

    book.apply_snapshot(
        j.contains("bids") ? parse_levels(j["bids"]) : std::vector<PriceLevel>{},
        j.contains("asks") ? parse_levels(j["asks"]) : std::vector<PriceLevel>{});

    if (auto tick = number_field(j, {"tick_size", "min_tick_size", "minimum_tick_size"})) {
        if (*tick > 0.0) book.set_tick_size(*tick);
    }
    book.set_neg_risk(bool_field(j, {"neg_risk", "negRisk"}).value_or(false));
    return book;
}

OrderAck parse_order_ack(const nlohmann::json& j, Side side) {
    OrderAck ack;
    if (!j.is_object()) {
        ack.error = "Unexpected order response";
        return ack;
    }

    auto error = string_field(j, {"error", "errorMsg", "error_msg"});
    bool success_flag = bool_field(j, {"success"}).value_or(true);
    if ((error && !error->empty()) || !success_flag) {
        ack.error = error && !error->empty() ? *error : "Order rejected";
        auto e = lower(ack.error);
        ack.insufficient_funds = e.find("balance") != std::string::npos ||
                                 e.find("allowance") != std::string::npos;
        return ack;
    }

    auto order_id = string_field(j, {"orderID", "orderId", "order_id", "id"});
    if (!order_id || order_id->empty()) {
        ack.error = "No order ID returned";
        return ack;
    }

    ack.accepted = true;
    ack.order_id = *order_id;
    ack.status = lower(string_field(j, {"status"}).value_or(""));
    ack.filled_shares = side == Side::BUY
        ? number_field(j, {"takingAmount"}).value_or(0.0)
        : number_field(j, {"makingAmount"}).value_or(0.0);
    return ack;
}

} // namespace adapters
} // namespace updown
