#pragma once

#include <string>
#include <memory>
#include <atomic>
#include "common/types.hpp"
#include "config/settings.hpp"
#include "exchange/exchange_client.hpp"
#include "execution/execution_engine.hpp"
#include "persistence/trade_store.hpp"

namespace updown {

struct StopLossRun {
    ResultStatus status{ResultStatus::OK};
    StopLossSummary summary;
    std::string message;
};

/**
 * Sells any held position whose live price falls below the configured
 * threshold. Independent of the scan cycle; non-reentrant with itself.
 */
class StopLossMonitor {
public:
    StopLossMonitor(std::shared_ptr<ExchangeClient> exchange,
                    std::shared_ptr<ExecutionEngine> engine,
                    std::shared_ptr<TradeStore> store,
                    std::shared_ptr<SettingsManager> settings);

    // One synchronous pass. SKIPPED when disabled or already running
    StopLossRun check_once();

    // Same pass, ignoring the enabled flag (operator trigger)
    StopLossRun check_now();

    bool is_running() const { return running_.load(); }

private:
    std::shared_ptr<ExchangeClient> exchange_;
    std::shared_ptr<ExecutionEngine> engine_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<SettingsManager> settings_;

    std::atomic<bool> running_{false};

    StopLossRun run(bool require_enabled);
    void close_trade(const Position& position, const SubmitResult& sale);
};

} // namespace updown
