#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "common/types.hpp"

namespace updown {

struct ScanRecord {
    int64_t id{0};
    int64_t scanned_at{0};       // epoch ms
    int markets{0};
    int opportunities{0};
    int trades{0};
};

struct TradeStats {
    int total{0};
    int open{0};
    int resolved{0};
    int failed{0};
    int wins{0};
    int losses{0};
    double total_pnl{0.0};
    double total_invested{0.0};
};

/**
 * Durable trade record store. The single source of truth for "is there
 * already an active trade on this market".
 */
class TradeStore {
public:
    virtual ~TradeStore() = default;

    // Active means pending, partial or open
    virtual std::optional<Trade> find_open_trade_by_market(const std::string& market_id) = 0;

    virtual void save(const Trade& trade) = 0;
    virtual void update(const Trade& trade) = 0;
    virtual void record_scan_summary(int markets, int opportunities, int trades) = 0;

    virtual std::optional<Trade> get_trade(const std::string& id) = 0;
    virtual std::vector<Trade> get_open_trades() = 0;
    virtual std::vector<Trade> get_recent_trades(int limit) = 0;
    virtual TradeStats get_trade_stats() = 0;
    virtual std::optional<ScanRecord> last_scan() = 0;

    virtual void set_state(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get_state(const std::string& key) = 0;
};

} // namespace updown
