#include "core/stop_loss_monitor.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace updown {

StopLossMonitor::StopLossMonitor(std::shared_ptr<ExchangeClient> exchange,
                                 std::shared_ptr<ExecutionEngine> engine,
                                 std::shared_ptr<TradeStore> store,
                                 std::shared_ptr<SettingsManager> settings)
    : exchange_(std::move(exchange))
    , engine_(std::move(engine))
    , store_(std::move(store))
    , settings_(std::move(settings))
{
}

StopLossRun StopLossMonitor::check_once() {
    return run(true);
}

StopLossRun StopLossMonitor::check_now() {
    return run(false);
}

StopLossRun StopLossMonitor::run(bool require_enabled) {
    StopLossRun result;
    auto settings = settings_->get_all().stop_loss;

    if (require_enabled && !settings.enabled) {
        result.status = ResultStatus::SKIPPED;
        result.message = "Stop-loss disabled";
        return result;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        result.status = ResultStatus::SKIPPED;
        result.message = "Stop-loss check already in progress";
        spdlog::debug("{}", result.message);
        return result;
    }
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    } release{running_};

    double threshold = normalize_threshold(settings.threshold);

    std::vector<Position> positions;
    try {
        positions = exchange_->get_positions();
    } catch (const std::exception& e) {
        result.status = ResultStatus::FAILED;
        result.message = std::string("Failed to fetch positions: ") + e.what();
        spdlog::error("{}", result.message);
        return result;
    }

    for (const auto& position : positions) {
        if (position.resolved || position.size <= 0.0) continue;
        if (position.current_price <= 0.0) {
            spdlog::warn("Stop-loss: no price for {} ({}), not selling", position.title, position.token_id);
            continue;
        }
        result.summary.checked++;

        if (position.current_price >= threshold) continue;

        spdlog::warn("STOP-LOSS: {} ({}) at {:.2f} below {:.2f}, selling {:.0f} shares",
                     position.title, position.outcome, position.current_price, threshold, position.size);

        try {
            auto sale = engine_->sell_position(position);
            if (sale.status == ResultStatus::OK) {
                result.summary.sold++;
                close_trade(position, sale);
            } else {
                result.summary.failed++;
                spdlog::error("Stop-loss sell failed for {}: {}", position.token_id, sale.reason);
            }
        } catch (const std::exception& e) {
            result.summary.failed++;
            spdlog::error("Stop-loss sell failed for {}: {}", position.token_id, e.what());
        }
    }

    const auto& s = result.summary;
    if (s.sold > 0 || s.failed > 0) {
        spdlog::info("Stop-loss pass: {} checked, {} sold, {} failed", s.checked, s.sold, s.failed);
    }
    if (s.failed > 0) {
        result.status = ResultStatus::FAILED;
        result.message = fmt::format("{} stop-loss sells failed", s.failed);
    }
    return result;
}

void StopLossMonitor::close_trade(const Position& position, const SubmitResult& sale) {
    try {
        for (auto trade : store_->get_open_trades()) {
            bool matches = trade.token_id == position.token_id ||
                           (!position.market_id.empty() && trade.market_id == position.market_id);
            if (!matches) continue;

            double proceeds = sale.price * sale.shares;

            // Less than a whole share left over cannot be sold again
            if (trade.size > 0.0 && trade.size - sale.shares >= 1.0) {
                double sold_cost = trade.cost * (sale.shares / trade.size);
                trade.pnl = trade.pnl.value_or(0.0) + proceeds - sold_cost;
                trade.size -= sale.shares;
                trade.cost -= sold_cost;
                trade.status = TradeStatus::PARTIAL;
                trade.note = fmt::format("stop-loss sold {:.0f} at {:.2f}", sale.shares, sale.price);
                store_->update(trade);
                spdlog::warn("Trade {} partly sold by stop-loss, {:.0f} shares still held, realized ${:.2f}",
                             trade.id, trade.size, *trade.pnl);
                return;
            }

            trade.pnl = trade.pnl.value_or(0.0) + proceeds - trade.cost;
            trade.status = TradeStatus::RESOLVED;
            trade.resolved_at = now_ms();
            trade.note = fmt::format("stop-loss at {:.2f}", sale.price);
            store_->update(trade);
            spdlog::info("Trade {} closed by stop-loss, PnL ${:.2f}", trade.id, *trade.pnl);
            return;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to record stop-loss for {}: {}", position.token_id, e.what());
    }
}

} // namespace updown
