#include "persistence/sqlite_trade_store.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace updown {

namespace {
    const char* TRADE_COLUMNS =
        "id, market_id, market_label, asset_id, side, token_id, token_id_b, "
        "entry_price, entry_price_b, size, size_b, cost, order_id_a, order_id_b, "
        "status, pnl, created_at, resolved_at, neg_risk, note";

    const char* ACTIVE_STATUSES = "('pending', 'partial', 'open')";
}

// ============================================================================
// CONNECTION
// ============================================================================

SqliteTradeStore::SqliteTradeStore(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // WAL mode for better concurrent access
    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA busy_timeout = 5000;");

    create_tables();
    create_indexes();

    spdlog::info("Trade store opened: {}", db_path);
}

SqliteTradeStore::~SqliteTradeStore() {
    close();
}

bool SqliteTradeStore::is_open() const {
    return db_ != nullptr;
}

void SqliteTradeStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("Trade store closed");
    }
}

void SqliteTradeStore::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* SqliteTradeStore::prepare(const std::string& sql) {
    if (!db_) {
        throw std::runtime_error("Trade store is closed");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteTradeStore::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteTradeStore::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void SqliteTradeStore::bind_double(sqlite3_stmt* stmt, int index, double value) {
    sqlite3_bind_double(stmt, index, value);
}

void SqliteTradeStore::bind_null(sqlite3_stmt* stmt, int index) {
    sqlite3_bind_null(stmt, index);
}

void SqliteTradeStore::step_done(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQL step failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteTradeStore::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

std::string SqliteTradeStore::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t SqliteTradeStore::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

double SqliteTradeStore::get_double(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);
}

bool SqliteTradeStore::is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// ============================================================================
// SCHEMA
// ============================================================================

void SqliteTradeStore::create_tables() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS trades (
            id TEXT PRIMARY KEY,
            market_id TEXT NOT NULL,
            market_label TEXT,
            asset_id TEXT,
            side TEXT NOT NULL,
            token_id TEXT,
            token_id_b TEXT,
            entry_price REAL NOT NULL,
            entry_price_b REAL,
            size REAL NOT NULL,
            size_b REAL,
            cost REAL NOT NULL,
            order_id_a TEXT,
            order_id_b TEXT,
            status TEXT NOT NULL,
            pnl REAL,
            created_at INTEGER NOT NULL,
            resolved_at INTEGER,
            neg_risk INTEGER NOT NULL DEFAULT 0,
            note TEXT
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS scan_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            scanned_at INTEGER NOT NULL,
            markets INTEGER NOT NULL,
            opportunities INTEGER NOT NULL,
            trades INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS bot_state (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");
}

void SqliteTradeStore::create_indexes() {
    execute("CREATE INDEX IF NOT EXISTS idx_trades_market ON trades(market_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_trades_status ON trades(status);");
    execute("CREATE INDEX IF NOT EXISTS idx_trades_created ON trades(created_at DESC);");
    execute("CREATE INDEX IF NOT EXISTS idx_scan_time ON scan_history(scanned_at DESC);");
}

// ============================================================================
// TRADES
// ============================================================================

void SqliteTradeStore::bind_trade(sqlite3_stmt* stmt, const Trade& t) {
    bind_text(stmt, 1, t.id);
    bind_text(stmt, 2, t.market_id);
    bind_text(stmt, 3, t.market_label);
    bind_text(stmt, 4, t.asset_id);
    bind_text(stmt, 5, outcome_to_string(t.side));
    bind_text(stmt, 6, t.token_id);
    bind_text(stmt, 7, t.token_id_b);
    bind_double(stmt, 8, t.entry_price);
    bind_double(stmt, 9, t.entry_price_b);
    bind_double(stmt, 10, t.size);
    bind_double(stmt, 11, t.size_b);
    bind_double(stmt, 12, t.cost);
    bind_text(stmt, 13, t.order_id_a);
    bind_text(stmt, 14, t.order_id_b);
    bind_text(stmt, 15, trade_status_to_string(t.status));
    if (t.pnl) bind_double(stmt, 16, *t.pnl); else bind_null(stmt, 16);
    bind_int64(stmt, 17, t.created_at);
    if (t.resolved_at) bind_int64(stmt, 18, *t.resolved_at); else bind_null(stmt, 18);
    bind_int64(stmt, 19, t.neg_risk ? 1 : 0);
    bind_text(stmt, 20, t.note);
}

Trade SqliteTradeStore::read_trade(sqlite3_stmt* stmt) {
    Trade t;
    t.id = get_text(stmt, 0);
    t.market_id = get_text(stmt, 1);
    t.market_label = get_text(stmt, 2);
    t.asset_id = get_text(stmt, 3);
    t.side = outcome_from_string(get_text(stmt, 4));
    t.token_id = get_text(stmt, 5);
    t.token_id_b = get_text(stmt, 6);
    t.entry_price = get_double(stmt, 7);
    t.entry_price_b = get_double(stmt, 8);
    t.size = get_double(stmt, 9);
    t.size_b = get_double(stmt, 10);
    t.cost = get_double(stmt, 11);
    t.order_id_a = get_text(stmt, 12);
    t.order_id_b = get_text(stmt, 13);
    t.status = trade_status_from_string(get_text(stmt, 14));
    if (!is_null(stmt, 15)) t.pnl = get_double(stmt, 15);
    t.created_at = get_int64(stmt, 16);
    if (!is_null(stmt, 17)) t.resolved_at = get_int64(stmt, 17);
    t.neg_risk = get_int64(stmt, 18) != 0;
    t.note = get_text(stmt, 19);
    return t;
}

std::vector<Trade> SqliteTradeStore::query_trades(const std::string& sql, const std::string& arg, int limit) {
    auto stmt = prepare(sql);
    int index = 1;
    if (!arg.empty()) bind_text(stmt, index++, arg);
    if (limit >= 0) bind_int64(stmt, index++, limit);

    std::vector<Trade> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(read_trade(stmt));
    }
    finalize(stmt);
    return out;
}

std::optional<Trade> SqliteTradeStore::find_open_trade_by_market(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = query_trades(std::string("SELECT ") + TRADE_COLUMNS +
                             " FROM trades WHERE market_id = ? AND status IN " + ACTIVE_STATUSES +
                             " ORDER BY created_at DESC LIMIT 1;", market_id);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

void SqliteTradeStore::save(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(std::string("INSERT INTO trades (") + TRADE_COLUMNS +
                        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bind_trade(stmt, trade);
    step_done(stmt);
}

void SqliteTradeStore::update(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        UPDATE trades SET
            market_id = ?2, market_label = ?3, asset_id = ?4, side = ?5, token_id = ?6,
            token_id_b = ?7, entry_price = ?8, entry_price_b = ?9, size = ?10, size_b = ?11,
            cost = ?12, order_id_a = ?13, order_id_b = ?14, status = ?15, pnl = ?16,
            created_at = ?17, resolved_at = ?18, neg_risk = ?19, note = ?20
        WHERE id = ?1;
    )");
    bind_trade(stmt, trade);
    step_done(stmt);

    if (sqlite3_changes(db_) == 0) {
        throw std::runtime_error("Trade not found: " + trade.id);
    }
}

std::optional<Trade> SqliteTradeStore::get_trade(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = query_trades(std::string("SELECT ") + TRADE_COLUMNS + " FROM trades WHERE id = ?;", id);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<Trade> SqliteTradeStore::get_open_trades() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_trades(std::string("SELECT ") + TRADE_COLUMNS +
                        " FROM trades WHERE status IN " + ACTIVE_STATUSES + " ORDER BY created_at ASC;");
}

std::vector<Trade> SqliteTradeStore::get_recent_trades(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_trades(std::string("SELECT ") + TRADE_COLUMNS +
                        " FROM trades ORDER BY created_at DESC LIMIT ?;", "", limit);
}

TradeStats SqliteTradeStore::get_trade_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT
            COUNT(*),
            SUM(CASE WHEN status IN ('pending', 'partial', 'open') THEN 1 ELSE 0 END),
            SUM(CASE WHEN status = 'resolved' THEN 1 ELSE 0 END),
            SUM(CASE WHEN status = 'failed' THEN 1 ELSE 0 END),
            SUM(CASE WHEN status = 'resolved' AND pnl > 0 THEN 1 ELSE 0 END),
            SUM(CASE WHEN status = 'resolved' AND pnl <= 0 THEN 1 ELSE 0 END),
            COALESCE(SUM(pnl), 0),
            COALESCE(SUM(CASE WHEN status NOT IN ('failed', 'cancelled') THEN cost ELSE 0 END), 0)
        FROM trades;
    )");

    TradeStats stats;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total = static_cast<int>(get_int64(stmt, 0));
        stats.open = static_cast<int>(get_int64(stmt, 1));
        stats.resolved = static_cast<int>(get_int64(stmt, 2));
        stats.failed = static_cast<int>(get_int64(stmt, 3));
        stats.wins = static_cast<int>(get_int64(stmt, 4));
        stats.losses = static_cast<int>(get_int64(stmt, 5));
        stats.total_pnl = get_double(stmt, 6);
        stats.total_invested = get_double(stmt, 7);
    }
    finalize(stmt);
    return stats;
}

// ============================================================================
// SCANS AND STATE
// ============================================================================

void SqliteTradeStore::record_scan_summary(int markets, int opportunities, int trades) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("INSERT INTO scan_history (scanned_at, markets, opportunities, trades) "
                        "VALUES (?, ?, ?, ?);");
    bind_int64(stmt, 1, now_ms());
    bind_int64(stmt, 2, markets);
    bind_int64(stmt, 3, opportunities);
    bind_int64(stmt, 4, trades);
    step_done(stmt);
}

std::optional<ScanRecord> SqliteTradeStore::last_scan() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT id, scanned_at, markets, opportunities, trades "
                        "FROM scan_history ORDER BY id DESC LIMIT 1;");
    std::optional<ScanRecord> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ScanRecord r;
        r.id = get_int64(stmt, 0);
        r.scanned_at = get_int64(stmt, 1);
        r.markets = static_cast<int>(get_int64(stmt, 2));
        r.opportunities = static_cast<int>(get_int64(stmt, 3));
        r.trades = static_cast<int>(get_int64(stmt, 4));
        out = r;
    }
    finalize(stmt);
    return out;
}

void SqliteTradeStore::set_state(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("INSERT INTO bot_state (key, value, updated_at) VALUES (?, ?, ?) "
                        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at;");
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);
    bind_int64(stmt, 3, now_ms());
    step_done(stmt);
}

std::optional<std::string> SqliteTradeStore::get_state(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT value FROM bot_state WHERE key = ?;");
    bind_text(stmt, 1, key);
    std::optional<std::string> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        out = get_text(stmt, 0);
    }
    finalize(stmt);
    return out;
}

} // namespace updown
