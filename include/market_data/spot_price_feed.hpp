#pragma once

#include <string>
#include <map>
#include <memory>
#include <vector>
#include "utils/http_client.hpp"

namespace updown {

/**
 * Underlying spot market volatility. Throws when the feed is unreachable;
 * callers treat that as "allow".
 */
class SpotPriceFeed {
public:
    virtual ~SpotPriceFeed() = default;

    // (max high - min low) / mid over the last hour, in percent
    virtual double hourly_swing_percent(const std::string& asset_id) = 0;
};

/**
 * Binance REST klines, twelve 5-minute candles.
 */
class BinanceSpotFeed : public SpotPriceFeed {
public:
    BinanceSpotFeed(std::shared_ptr<HttpTransport> http, std::string base_url,
                    std::map<std::string, std::string> symbols);

    double hourly_swing_percent(const std::string& asset_id) override;

    // Kline rows are [openTime, open, high, low, close, ...] with string prices
    static double swing_from_klines(const std::string& body);

private:
    std::shared_ptr<HttpTransport> http_;
    std::string base_url_;
    std::map<std::string, std::string> symbols_;
};

} // namespace updown
