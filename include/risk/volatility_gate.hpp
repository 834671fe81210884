#pragma once

#include <string>
#include <memory>
#include <optional>
#include "risk/trading_window.hpp"
#include "config/settings.hpp"
#include "market_data/spot_price_feed.hpp"
#include "exchange/exchange_client.hpp"

namespace updown {

struct VolatilityDetails {
    std::optional<int> hour_et;
    std::optional<double> swing_percent;
    std::optional<double> spread_cents;
    std::optional<double> volume_usd;
};

/**
 * Staged volatility filter. The quick check is pure; the spot-swing and
 * spread checks do I/O and pass when their source is unavailable.
 */
class VolatilityGate {
public:
    VolatilityGate(std::shared_ptr<SpotPriceFeed> spot, std::shared_ptr<ExchangeClient> exchange);

    // Volatile hours in US Eastern time only
    GateResult quick_check(const VolatilitySettings& settings, WallClock now) const;

    GateResult check_all(const VolatilitySettings& settings, const std::string& asset_id,
                         const std::string& token_id, double volume_usd, WallClock now,
                         VolatilityDetails* details = nullptr) const;

private:
    std::shared_ptr<SpotPriceFeed> spot_;
    std::shared_ptr<ExchangeClient> exchange_;
};

} // namespace updown
