#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <chrono>
#include <functional>
#include "common/types.hpp"
#include "config/settings.hpp"
#include "market_data/market_data_source.hpp"
#include "chain/settlement_client.hpp"
#include "persistence/trade_store.hpp"

namespace updown {

struct ClaimRun {
    ResultStatus status{ResultStatus::OK};
    ClaimSummary summary;
    std::string message;
};

/**
 * Auto-claim sweep. Every resolved market in the lookback is attempted;
 * whether a position was held is learned from the redemption outcome.
 */
class ClaimSweeper {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ClaimSweeper(std::shared_ptr<MarketDataSource> markets,
                 std::shared_ptr<SettlementClient> settlement,
                 std::shared_ptr<TradeStore> store,
                 std::shared_ptr<SettingsManager> settings,
                 Sleeper sleeper = nullptr);

    // SKIPPED when a sweep is already running
    ClaimRun claim_all(int days_back);

    bool is_running() const { return running_.load(); }

    void set_delays(std::chrono::milliseconds after_success, std::chrono::milliseconds after_other) {
        delay_success_ = after_success;
        delay_other_ = after_other;
    }

    // Failure texts meaning "no position held"
    static bool is_expected_failure(const std::string& message);

    // Resolve an active trade against the market winner; false if nothing to settle
    static bool settle_trade(Trade& trade, Outcome winner, int64_t resolved_at_ms);

private:
    std::shared_ptr<MarketDataSource> markets_;
    std::shared_ptr<SettlementClient> settlement_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<SettingsManager> settings_;
    Sleeper sleeper_;

    std::chrono::milliseconds delay_success_{3000};
    std::chrono::milliseconds delay_other_{1000};

    std::atomic<bool> running_{false};

    void sweep_asset(const std::string& asset_id, int days_back, GasSpeed speed, ClaimSummary& summary);
};

} // namespace updown
