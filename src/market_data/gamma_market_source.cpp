#include "market_data/market_data_source.hpp"
#include "market_data/market_adapters.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace updown {

GammaMarketDataSource::GammaMarketDataSource(const Config& config,
                                             std::shared_ptr<HttpTransport> http,
                                             ClockFn clock)
    : gamma_url_(config.connection.gamma_url)
    , clob_url_(config.connection.clob_url)
    , series_ids_(config.series_ids)
    , http_(std::move(http))
    , clock_(std::move(clock))
{
}

nlohmann::json GammaMarketDataSource::fetch_series(const std::string& asset_id) {
    auto it = series_ids_.find(asset_id);
    if (it == series_ids_.end() || it->second.empty()) {
        return nlohmann::json();
    }
    return nlohmann::json::parse(http_->get(gamma_url_ + "/series/" + it->second));
}

nlohmann::json GammaMarketDataSource::fetch_event(const std::string& event_id) {
    return nlohmann::json::parse(http_->get(gamma_url_ + "/events/" + event_id));
}

Price GammaMarketDataSource::fetch_price(const std::string& token_id) {
    try {
        auto j = nlohmann::json::parse(http_->get(clob_url_ + "/book?token_id=" + token_id));
        return adapters::parse_order_book(token_id, j).quote_price();
    } catch (const std::exception& e) {
        spdlog::debug("Failed to get price for {}: {}", token_id, e.what());
        return 0.0;
    }
}

std::vector<MarketQuote> GammaMarketDataSource::list_open_markets(const std::string& asset_id) {
    std::vector<MarketQuote> quotes;

    auto series = fetch_series(asset_id);
    if (series.is_null()) {
        spdlog::debug("[{}] No series configured, zero markets", asset_id);
        return quotes;
    }

    auto now = clock_();
    auto horizon = now + std::chrono::hours(lookahead_hours_);

    auto events = adapters::parse_series_events(series);
    events.erase(std::remove_if(events.begin(), events.end(), [&](const adapters::SeriesEvent& e) {
        return e.closed || e.end_time <= now || e.end_time > horizon;
    }), events.end());
    std::sort(events.begin(), events.end(), [](const auto& a, const auto& b) {
        return a.end_time < b.end_time;
    });

    for (const auto& event : events) {
        nlohmann::json detail;
        try {
            detail = fetch_event(event.id);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Failed to fetch event {}: {}", asset_id, event.id, e.what());
            continue;
        }

        for (const auto& market : adapters::event_markets(detail)) {
            if (adapters::bool_field(market, {"closed"}).value_or(false)) continue;

            auto quote = adapters::parse_market_quote(market, event, asset_id);
            if (!quote) continue;

            // Book-derived prices replace the seeded outcomePrices
            Price up = fetch_price(quote->side_a.token_id);
            Price down = fetch_price(quote->side_b.token_id);
            if (up > 0.0) quote->side_a.price = up;
            if (down > 0.0) quote->side_b.price = down;

            quotes.push_back(*quote);
        }
    }

    spdlog::info("[{}] Found {} open markets", asset_id, quotes.size());
    return quotes;
}

std::vector<ResolvedMarket> GammaMarketDataSource::list_resolved_markets(const std::string& asset_id,
                                                                         int since_days) {
    std::vector<ResolvedMarket> resolved;

    auto series = fetch_series(asset_id);
    if (series.is_null()) return resolved;

    auto now = clock_();
    auto cutoff = now - std::chrono::hours(24 * since_days);

    for (const auto& event : adapters::parse_series_events(series)) {
        if (!event.closed && event.end_time > now) continue;
        if (event.end_time < cutoff) continue;

        nlohmann::json detail;
        try {
            detail = fetch_event(event.id);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Failed to fetch resolved event {}: {}", asset_id, event.id, e.what());
            continue;
        }

        for (const auto& market : adapters::event_markets(detail)) {
            if (auto r = adapters::parse_resolved_market(market, event, asset_id)) {
                resolved.push_back(*r);
            }
        }
    }

    spdlog::info("[{}] Found {} resolved markets in the last {} days", asset_id, resolved.size(), since_days);
    return resolved;
}

} // namespace updown
