#include "execution/claim_sweeper.hpp"
#include <algorithm>
#include <cctype>
#include <thread>
#include <spdlog/spdlog.h>

namespace updown {

ClaimSweeper::ClaimSweeper(std::shared_ptr<MarketDataSource> markets,
                           std::shared_ptr<SettlementClient> settlement,
                           std::shared_ptr<TradeStore> store,
                           std::shared_ptr<SettingsManager> settings,
                           Sleeper sleeper)
    : markets_(std::move(markets))
    , settlement_(std::move(settlement))
    , store_(std::move(store))
    , settings_(std::move(settings))
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

bool ClaimSweeper::is_expected_failure(const std::string& message) {
    std::string m = message;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* pattern : {"nothing to redeem", "already redeemed", "no position",
                                "zero balance", "payout is zero"}) {
        if (m.find(pattern) != std::string::npos) return true;
    }
    return false;
}

bool ClaimSweeper::settle_trade(Trade& trade, Outcome winner, int64_t resolved_at_ms) {
    if (!is_active_status(trade.status)) return false;

    double payout = trade.side == winner ? trade.size : 0.0;
    if (!trade.token_id_b.empty() && trade.side != winner) {
        payout += trade.size_b;
    }

    // Keeps any PnL already realized by a partial stop-loss sale
    trade.pnl = trade.pnl.value_or(0.0) + payout - trade.cost;
    trade.status = TradeStatus::RESOLVED;
    trade.resolved_at = resolved_at_ms;
    return true;
}

ClaimRun ClaimSweeper::claim_all(int days_back) {
    ClaimRun run;

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        run.status = ResultStatus::SKIPPED;
        run.message = "Claim sweep already in progress";
        spdlog::warn("{}", run.message);
        return run;
    }
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    } release{running_};

    auto settings = settings_->get_all();
    spdlog::info("=== CLAIM SWEEP START ({} days back) ===", days_back);

    for (const auto& [asset_id, asset] : settings.assets) {
        if (!asset.auto_claim_enabled) continue;
        try {
            sweep_asset(asset_id, days_back, settings.advanced.gas_speed, run.summary);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Claim sweep failed: {}", asset_id, e.what());
            run.summary.errors.push_back(asset_id + ": " + e.what());
        }
    }

    const auto& s = run.summary;
    spdlog::info("=== CLAIM SWEEP COMPLETE: {} attempted, {} claimed, {} skipped, {} failed, {} trades settled ===",
                 s.attempted, s.success, s.skipped, s.failed, s.trades_settled);

    if (s.failed > 0 || !s.errors.empty()) {
        run.status = ResultStatus::FAILED;
        run.message = s.errors.empty() ? "" : s.errors.front();
    }
    return run;
}

void ClaimSweeper::sweep_asset(const std::string& asset_id, int days_back, GasSpeed speed,
                               ClaimSummary& summary) {
    auto resolved = markets_->list_resolved_markets(asset_id, days_back);
    spdlog::info("[{}] {} resolved markets to check", asset_id, resolved.size());

    for (const auto& market : resolved) {
        if (market.winner) {
            try {
                if (auto trade = store_->find_open_trade_by_market(market.market_id)) {
                    if (settle_trade(*trade, *market.winner, now_ms())) {
                        store_->update(*trade);
                        summary.trades_settled++;
                        spdlog::info("[{}] Trade {} resolved ({} won), PnL ${:.2f}",
                                     asset_id, trade->id, outcome_to_string(*market.winner), *trade->pnl);
                    }
                }
            } catch (const std::exception& e) {
                spdlog::error("[{}] Failed to settle trade for {}: {}", asset_id, market.market_id, e.what());
            }
        }

        if (!settlement_->can_sign()) {
            continue;
        }

        summary.attempted++;
        RedeemRequest req;
        req.condition_id = market.market_id;
        req.neg_risk = market.neg_risk;
        req.token_id_a = market.token_id_a;
        req.token_id_b = market.token_id_b;

        bool succeeded = false;
        try {
            auto tx = settlement_->redeem(req, speed);
            summary.success++;
            succeeded = true;
            if (tx.status_unknown) {
                spdlog::warn("[{}] Redeem {} sent ({}), confirmation pending", asset_id, market.title, tx.tx_hash);
            } else {
                spdlog::info("[{}] Redeemed {} ({})", asset_id, market.title, tx.tx_hash);
            }
        } catch (const std::exception& e) {
            if (is_expected_failure(e.what())) {
                summary.skipped++;
                spdlog::debug("[{}] Nothing to claim for {}: {}", asset_id, market.title, e.what());
            } else {
                summary.failed++;
                summary.errors.push_back(market.market_id + ": " + e.what());
                spdlog::error("[{}] Redeem failed for {}: {}", asset_id, market.title, e.what());
            }
        }

        sleeper_(succeeded ? delay_success_ : delay_other_);
    }

    if (!settlement_->can_sign() && !resolved.empty()) {
        spdlog::warn("[{}] No signing key - redemption skipped", asset_id);
    }
}

} // namespace updown
