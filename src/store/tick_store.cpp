#include "src/store/tick_store.hpp"

#include "common/errors.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace optick {

namespace {

constexpr const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS ticks (
        ts_ns INTEGER NOT NULL,
        instrument_key TEXT NOT NULL,
        ltp REAL,
        cp REAL,
        oi REAL,
        iv REAL,
        delta REAL,
        gamma REAL,
        vega REAL,
        theta REAL
    );
    CREATE INDEX IF NOT EXISTS idx_instrument_time
        ON ticks (instrument_key, ts_ns);
)";

constexpr const char* INSERT_SQL =
    "INSERT INTO ticks (ts_ns, instrument_key, ltp, cp, oi, iv, delta, gamma, vega, theta) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)";

bool is_busy(int rc) {
    const int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": ";
    msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw StorageError(msg, rc, is_busy(rc));
}

} // namespace

// --- Statement ---

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw_sqlite(db_, rc, "prepare failed");
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::bind(int idx, int64_t v) {
    const int rc = sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int idx, double v) {
    const int rc = sqlite3_bind_double(stmt_, idx, v);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int idx, const std::string& v) {
    const int rc = sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "step failed");
}

void Statement::reset() {
    // sqlite3_reset repeats the last step error, which step() already reported
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double Statement::column_double(int col) const {
    return column_optional_double(col).value_or(0.0);
}

std::optional<double> Statement::column_optional_double(int col) const {
    switch (sqlite3_column_type(stmt_, col)) {
        case SQLITE_FLOAT:
        case SQLITE_INTEGER:
            return sqlite3_column_double(stmt_, col);
        default:
            return std::nullopt;    // NULL, TEXT, BLOB
    }
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

// --- TickStore ---

TickStore::TickStore(const std::string& path, Mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= mode == Mode::ReadWrite ? (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)
                                     : SQLITE_OPEN_READONLY;

    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = "cannot open tick store '" + path + "': " +
                                (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(msg, rc, is_busy(rc));
    }

    try {
        const int brc = sqlite3_busy_timeout(db_, busy_timeout_ms);
        if (brc != SQLITE_OK) throw_sqlite(db_, brc, "cannot set busy timeout");
        if (mode_ == Mode::ReadWrite) {
            exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA synchronous=NORMAL");
            ensure_schema();
            insert_ = std::make_unique<Statement>(db_, INSERT_SQL);
        }
    } catch (...) {
        insert_.reset();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    spdlog::debug("Opened tick store {} ({})", path_,
                  mode_ == Mode::ReadWrite ? "read-write" : "read-only");
}

TickStore::~TickStore() {
    insert_.reset();
    if (db_ && sqlite3_close(db_) != SQLITE_OK) {
        spdlog::warn("Tick store {} did not close cleanly: {}", path_, sqlite3_errmsg(db_));
    }
}

void TickStore::exec(const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StorageError(msg, rc, is_busy(rc));
    }
}

void TickStore::ensure_schema() {
    exec(SCHEMA_SQL);
}

void TickStore::append(const Observation& row) {
    append(std::vector<Observation>{row});
}

void TickStore::append(const std::vector<Observation>& rows) {
    if (mode_ != Mode::ReadWrite) {
        throw StorageError("tick store opened read-only", SQLITE_READONLY, false);
    }
    if (rows.empty()) return;

    // IMMEDIATE takes the write lock up front, waiting at most busy_timeout
    exec("BEGIN IMMEDIATE");
    try {
        for (const Observation& o : rows) {
            const TickFields& f = o.fields;
            insert_->bind(1, o.ts_ns)
                .bind(2, o.instrument_id)
                .bind(3, f.last_price)
                .bind(4, f.prev_close)
                .bind(5, f.open_interest)
                .bind(6, f.implied_vol)
                .bind(7, f.delta)
                .bind(8, f.gamma)
                .bind(9, f.vega)
                .bind(10, f.theta);
            insert_->step();
            insert_->reset();
        }
        exec("COMMIT");
    } catch (const StorageError&) {
        insert_->reset();
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            spdlog::warn("Rollback failed on {}: {}", path_, err ? err : "unknown");
        }
        sqlite3_free(err);
        throw;
    }
}

Statement TickStore::prepare(const std::string& sql) const {
    return Statement(db_, sql);
}

} // namespace optick
