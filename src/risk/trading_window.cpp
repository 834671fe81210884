#include "risk/trading_window.hpp"
#include "utils/time_utils.hpp"
#include <fmt/format.h>

namespace updown {

std::string GateResult::summary() const {
    std::string out;
    for (const auto& r : reasons) {
        if (!out.empty()) out += "; ";
        out += r;
    }
    return out;
}

TradingWindowGate::TradingWindowGate(TradingWindowSettings settings)
    : settings_(settings)
{
}

bool TradingWindowGate::is_in_window(int minute) const {
    const int start = settings_.start_minute;
    const int end = settings_.end_minute;
    if (start <= end) {
        return minute >= start && minute <= end;
    }
    return minute >= start || minute <= end;
}

int TradingWindowGate::minutes_until_window(int minute) const {
    if (is_in_window(minute)) return 0;
    return ((settings_.start_minute - minute) % 60 + 60) % 60;
}

GateResult TradingWindowGate::check(WallClock now) const {
    GateResult result;
    int minute = time_utils::minute_of_hour(now);
    if (!is_in_window(minute)) {
        result.block(fmt::format("Outside trading window (minute {}, window {}-{}, opens in {} min)",
                                 minute, settings_.start_minute, settings_.end_minute,
                                 minutes_until_window(minute)));
    }
    return result;
}

} // namespace updown
