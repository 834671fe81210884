#include "risk/volatility_gate.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace updown {

VolatilityGate::VolatilityGate(std::shared_ptr<SpotPriceFeed> spot,
                               std::shared_ptr<ExchangeClient> exchange)
    : spot_(std::move(spot))
    , exchange_(std::move(exchange))
{
}

GateResult VolatilityGate::quick_check(const VolatilitySettings& settings, WallClock now) const {
    GateResult result;
    if (!settings.enabled || !settings.skip_volatile_hours) {
        return result;
    }

    int hour = time_utils::eastern_hour(now);
    const auto& hours = settings.volatile_hours_et;
    if (std::find(hours.begin(), hours.end(), hour) != hours.end()) {
        result.block(fmt::format("Volatile hour ({}:00 ET)", hour));
    }
    return result;
}

GateResult VolatilityGate::check_all(const VolatilitySettings& settings, const std::string& asset_id,
                                     const std::string& token_id, double volume_usd, WallClock now,
                                     VolatilityDetails* details) const {
    GateResult result = quick_check(settings, now);
    if (!settings.enabled) {
        return result;
    }

    if (details && settings.skip_volatile_hours) {
        details->hour_et = time_utils::eastern_hour(now);
    }

    if (settings.check_real_time_volatility && spot_) {
        try {
            double swing = spot_->hourly_swing_percent(asset_id);
            if (details) details->swing_percent = swing;
            if (swing > settings.max_hourly_volatility_percent) {
                result.block(fmt::format("High volatility: {:.1f}%", swing));
            }
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Volatility check unavailable, allowing: {}", asset_id, e.what());
        }
    }

    if (settings.check_spread && exchange_ && !token_id.empty()) {
        try {
            double spread = exchange_->get_order_book(token_id).spread_cents();
            if (details) details->spread_cents = spread;
            if (spread > settings.max_spread_cents) {
                result.block(fmt::format("Wide spread: {:.1f}c", spread));
            }
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Spread check unavailable, allowing: {}", asset_id, e.what());
        }
    }

    if (settings.check_volume) {
        if (details) details->volume_usd = volume_usd;
        if (volume_usd < settings.min_volume_usd) {
            result.block(fmt::format("Volume too low: ${:.0f} < ${:.0f}", volume_usd, settings.min_volume_usd));
        } else if (volume_usd > settings.max_volume_usd) {
            result.block(fmt::format("Volume unusually high: ${:.0f} > ${:.0f}", volume_usd, settings.max_volume_usd));
        }
    }

    if (!result.can_trade) {
        spdlog::info("[{}] Volatility gate blocked: {}", asset_id, result.summary());
    }
    return result;
}

} // namespace updown
