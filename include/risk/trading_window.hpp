#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/settings.hpp"

namespace updown {

struct GateResult {
    bool can_trade{true};
    std::vector<std::string> reasons;

    void block(const std::string& reason) {
        can_trade = false;
        reasons.push_back(reason);
    }

    std::string summary() const;
};

/**
 * Minute-of-hour execution window. A start after the end wraps across
 * the top of the hour (e.g. 55-5).
 */
class TradingWindowGate {
public:
    explicit TradingWindowGate(TradingWindowSettings settings);

    bool is_in_window(int minute) const;

    // 0 inside the window
    int minutes_until_window(int minute) const;

    GateResult check(WallClock now) const;

    const TradingWindowSettings& settings() const { return settings_; }

private:
    TradingWindowSettings settings_;
};

} // namespace updown
