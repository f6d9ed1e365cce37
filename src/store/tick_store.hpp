#pragma once

#include "common/tick.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace optick {

// RAII prepared statement. Column getters coerce NULL / non-numeric to 0.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // 1-based parameter index, as in sqlite3_bind_*
    Statement& bind(int idx, int64_t v);
    Statement& bind(int idx, double v);
    Statement& bind(int idx, const std::string& v);

    // true while rows are available; throws StorageError on failure
    bool step();
    void reset();

    int64_t column_int64(int col) const;
    double column_double(int col) const;
    std::optional<double> column_optional_double(int col) const;
    std::string column_text(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

// Embedded append-only tick table keyed by (instrument_key, ts_ns).
//
// ReadWrite opens (creating if needed) the file in WAL mode, ensures the
// schema and owns the insert path; it must be used from one thread.
// ReadOnly connections are serialized and may be shared by query threads.
class TickStore {
public:
    enum class Mode { ReadWrite, ReadOnly };

    explicit TickStore(const std::string& path, Mode mode = Mode::ReadWrite,
                       int busy_timeout_ms = 250);
    ~TickStore();

    TickStore(const TickStore&) = delete;
    TickStore& operator=(const TickStore&) = delete;

    // Appends all rows in one transaction. Throws StorageError (busy() set
    // when the write lock was not obtained within the busy timeout).
    void append(const std::vector<Observation>& rows);
    void append(const Observation& row);

    Statement prepare(const std::string& sql) const;

    const std::string& path() const { return path_; }

private:
    void exec(const char* sql);
    void ensure_schema();

    std::string path_;
    Mode mode_;
    sqlite3* db_ = nullptr;
    std::unique_ptr<Statement> insert_;
};

} // namespace optick
