#pragma once

#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/settings.hpp"

namespace updown {

/**
 * Price band -> assumed win probability. Bands are matched highest
 * min_price first; below every band the implied price is used.
 */
class WinRateTable {
public:
    WinRateTable();
    explicit WinRateTable(std::vector<WinRateBand> bands);

    double win_rate(Price price) const;

    const std::vector<WinRateBand>& bands() const { return bands_; }

private:
    std::vector<WinRateBand> bands_;
};

/**
 * Single-leg threshold strategy: buy the side whose price sits inside
 * [min_price, max_price]. Stateless; safe to call from any thread.
 */
class StrategyCalculator {
public:
    explicit StrategyCalculator(WinRateTable table = WinRateTable());

    // Side A is checked before side B
    std::optional<Opportunity> evaluate(const MarketQuote& quote, Price min_price,
                                        Price max_price, Notional bet_size) const;

    // Highest expected value first; equal EVs keep discovery order
    std::vector<Opportunity> find_opportunities(const std::vector<MarketQuote>& quotes,
                                                const AssetSettings& asset) const;

    LiveMarketView analyze(const MarketQuote& quote, const AssetSettings& asset,
                           WallClock now) const;

    const WinRateTable& table() const { return table_; }

private:
    WinRateTable table_;
};

} // namespace updown
