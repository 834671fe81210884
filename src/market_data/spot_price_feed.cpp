#include "market_data/spot_price_feed.hpp"
#include "market_data/market_adapters.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace updown {

BinanceSpotFeed::BinanceSpotFeed(std::shared_ptr<HttpTransport> http, std::string base_url,
                                 std::map<std::string, std::string> symbols)
    : http_(std::move(http))
    , base_url_(std::move(base_url))
    , symbols_(std::move(symbols))
{
}

double BinanceSpotFeed::swing_from_klines(const std::string& body) {
    auto klines = nlohmann::json::parse(body);
    if (!klines.is_array() || klines.empty()) {
        throw std::runtime_error("No kline data");
    }

    double high = 0.0;
    double low = std::numeric_limits<double>::max();
    for (const auto& k : klines) {
        if (!k.is_array() || k.size() < 4) continue;
        auto h = adapters::as_number(k[2]);
        auto l = adapters::as_number(k[3]);
        if (!h || !l) continue;
        high = std::max(high, *h);
        low = std::min(low, *l);
    }

    if (high <= 0.0 || low == std::numeric_limits<double>::max()) {
        throw std::runtime_error("Unusable kline data");
    }

    double mid = (high + low) / 2.0;
    return (high - low) / mid * 100.0;
}

double BinanceSpotFeed::hourly_swing_percent(const std::string& asset_id) {
    auto it = symbols_.find(asset_id);
    if (it == symbols_.end()) {
        throw std::runtime_error("No spot symbol for " + asset_id);
    }

    std::string url = base_url_ + "/klines?symbol=" + it->second + "USDT&interval=5m&limit=12";
    double swing = swing_from_klines(http_->get(url));
    spdlog::debug("[{}] Hourly swing {:.2f}%", asset_id, swing);
    return swing;
}

} // namespace updown
