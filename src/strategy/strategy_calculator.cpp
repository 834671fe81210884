#include "strategy/strategy_calculator.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace updown {

WinRateTable::WinRateTable()
    : WinRateTable(BotSettings::factory_defaults().win_rate_table)
{
}

WinRateTable::WinRateTable(std::vector<WinRateBand> bands)
    : bands_(std::move(bands))
{
    std::sort(bands_.begin(), bands_.end(), [](const WinRateBand& a, const WinRateBand& b) {
        return a.min_price > b.min_price;
    });
}

double WinRateTable::win_rate(Price price) const {
    for (const auto& band : bands_) {
        if (price >= band.min_price) {
            return band.win_rate;
        }
    }
    return price;
}

StrategyCalculator::StrategyCalculator(WinRateTable table)
    : table_(std::move(table))
{
}

std::optional<Opportunity> StrategyCalculator::evaluate(const MarketQuote& quote, Price min_price,
                                                        Price max_price, Notional bet_size) const {
    if (quote.side_a.price <= 0.0 || quote.side_b.price <= 0.0 || bet_size <= 0.0) {
        return std::nullopt;
    }

    auto build = [&](Outcome side, const OutcomeQuote& q) {
        Opportunity opp;
        opp.quote = quote;
        opp.side = side;
        opp.token_id = q.token_id;
        opp.price = q.price;
        opp.size_shares = bet_size / q.price;
        opp.expected_win_rate = table_.win_rate(q.price);
        opp.expected_value = (opp.expected_win_rate - q.price) * opp.size_shares;
        opp.bet_size = bet_size;
        return opp;
    };

    if (quote.side_a.price >= min_price && quote.side_a.price <= max_price) {
        return build(Outcome::UP, quote.side_a);
    }
    if (quote.side_b.price >= min_price && quote.side_b.price <= max_price) {
        return build(Outcome::DOWN, quote.side_b);
    }

    spdlog::debug("[{}] {}: no side in band (Up={:.1f}c, Down={:.1f}c)",
                  quote.asset_id, quote.title, quote.side_a.price * 100, quote.side_b.price * 100);
    return std::nullopt;
}

std::vector<Opportunity> StrategyCalculator::find_opportunities(const std::vector<MarketQuote>& quotes,
                                                                const AssetSettings& asset) const {
    std::vector<Opportunity> out;
    for (const auto& q : quotes) {
        if (auto opp = evaluate(q, asset.min_price, asset.max_price, asset.bet_size)) {
            spdlog::info("[{}] Opportunity: {} {} at {:.1f}c, win rate {:.0f}%, EV +${:.2f}",
                         q.asset_id, q.title, outcome_to_string(opp->side), opp->price * 100,
                         opp->expected_win_rate * 100, opp->expected_value);
            out.push_back(*opp);
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const Opportunity& a, const Opportunity& b) {
        return a.expected_value > b.expected_value;
    });
    return out;
}

LiveMarketView StrategyCalculator::analyze(const MarketQuote& quote, const AssetSettings& asset,
                                           WallClock now) const {
    LiveMarketView view;
    view.event_id = quote.event_id;
    view.market_id = quote.market_id;
    view.title = quote.title;
    view.up_price = quote.side_a.price;
    view.down_price = quote.side_b.price;
    view.combined_cost = quote.side_a.price + quote.side_b.price;
    view.hours_left = quote.hours_until_close(now);

    if (auto opp = evaluate(quote, asset.min_price, asset.max_price, asset.bet_size)) {
        view.is_viable = true;
        view.viable_side = opp->side;
        view.expected_value = opp->expected_value;
    }
    return view;
}

} // namespace updown
