#pragma once

#include <string>
#include <mutex>
#include "persistence/trade_store.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace updown {

/**
 * SQLite-backed trade store (WAL journal). All access is serialized
 * through one connection and a mutex.
 */
class SqliteTradeStore : public TradeStore {
public:
    explicit SqliteTradeStore(const std::string& db_path);
    ~SqliteTradeStore() override;

    // Non-copyable
    SqliteTradeStore(const SqliteTradeStore&) = delete;
    SqliteTradeStore& operator=(const SqliteTradeStore&) = delete;

    bool is_open() const;
    void close();

    std::optional<Trade> find_open_trade_by_market(const std::string& market_id) override;
    void save(const Trade& trade) override;
    void update(const Trade& trade) override;
    void record_scan_summary(int markets, int opportunities, int trades) override;

    std::optional<Trade> get_trade(const std::string& id) override;
    std::vector<Trade> get_open_trades() override;
    std::vector<Trade> get_recent_trades(int limit) override;
    TradeStats get_trade_stats() override;
    std::optional<ScanRecord> last_scan() override;

    void set_state(const std::string& key, const std::string& value) override;
    std::optional<std::string> get_state(const std::string& key) override;

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    std::mutex mutex_;

    void execute(const std::string& sql);
    void create_tables();
    void create_indexes();

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_double(sqlite3_stmt* stmt, int index, double value);
    void bind_null(sqlite3_stmt* stmt, int index);
    void step_done(sqlite3_stmt* stmt);
    void finalize(sqlite3_stmt* stmt);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    double get_double(sqlite3_stmt* stmt, int col);
    bool is_null(sqlite3_stmt* stmt, int col);

    void bind_trade(sqlite3_stmt* stmt, const Trade& trade);
    Trade read_trade(sqlite3_stmt* stmt);
    std::vector<Trade> query_trades(const std::string& sql, const std::string& arg = "", int limit = -1);
};

} // namespace updown
