#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include "common/types.hpp"
#include "utils/http_client.hpp"
#include "config/config.hpp"

namespace updown {

/**
 * Source of candidate up/down markets per underlying asset. Zero markets
 * is a normal answer; transport failures throw.
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    // Open markets ending in the future, soonest first, with live prices
    virtual std::vector<MarketQuote> list_open_markets(const std::string& asset_id) = 0;

    // Markets closed within the last since_days days
    virtual std::vector<ResolvedMarket> list_resolved_markets(const std::string& asset_id, int since_days) = 0;
};

/**
 * Gamma series/events discovery with prices from CLOB order books.
 */
class GammaMarketDataSource : public MarketDataSource {
public:
    GammaMarketDataSource(const Config& config, std::shared_ptr<HttpTransport> http,
                          ClockFn clock = wall_now);

    std::vector<MarketQuote> list_open_markets(const std::string& asset_id) override;
    std::vector<ResolvedMarket> list_resolved_markets(const std::string& asset_id, int since_days) override;

    // Only events ending within this horizon are priced
    void set_lookahead_hours(int hours) { lookahead_hours_ = hours; }

private:
    std::string gamma_url_;
    std::string clob_url_;
    std::map<std::string, std::string> series_ids_;
    std::shared_ptr<HttpTransport> http_;
    ClockFn clock_;
    int lookahead_hours_{24};

    nlohmann::json fetch_series(const std::string& asset_id);
    nlohmann::json fetch_event(const std::string& event_id);
    Price fetch_price(const std::string& token_id);
};

} // namespace updown
