#include "src/query/snapshot_query.hpp"

#include "common/errors.hpp"
#include "src/store/tick_store.hpp"

#include <algorithm>

namespace optick {

namespace {

// Grouped MAX(ts_ns) per key is answered from the composite index; the join
// fetches the full row at (key, max_ts). rowid order lets a later duplicate
// of the same (key, ts) win.
std::string snapshot_sql(size_t n_ids) {
    std::string placeholders;
    for (size_t i = 0; i < n_ids; ++i) {
        if (i) placeholders += ", ";
        placeholders += "?" + std::to_string(i + 3);
    }

    return "SELECT t.instrument_key, t.ts_ns, t.ltp, t.cp, t.oi, t.iv, "
           "t.delta, t.gamma, t.vega, t.theta "
           "FROM ticks AS t "
           "JOIN (SELECT instrument_key, MAX(ts_ns) AS max_ts FROM ticks "
           "      WHERE instrument_key IN (" + placeholders + ") "
           "        AND ts_ns BETWEEN ?1 AND ?2 "
           "      GROUP BY instrument_key) AS m "
           "  ON t.instrument_key = m.instrument_key AND t.ts_ns = m.max_ts "
           "ORDER BY t.rowid";
}

} // namespace

std::map<std::string, SnapshotRow> SnapshotQuery::snapshot(const std::set<std::string>& ids,
                                                           int64_t start_ns,
                                                           int64_t end_ns) const {
    if (start_ns > end_ns) {
        throw QueryError("snapshot window start is after end");
    }

    std::map<std::string, SnapshotRow> out;
    if (ids.empty()) {
        return out;
    }

    std::vector<const std::string*> chunk;
    chunk.reserve(std::min(ids.size(), CHUNK));
    for (const std::string& id : ids) {
        chunk.push_back(&id);
        if (chunk.size() == CHUNK) {
            run_chunk(chunk, start_ns, end_ns, out);
            chunk.clear();
        }
    }
    if (!chunk.empty()) {
        run_chunk(chunk, start_ns, end_ns, out);
    }
    return out;
}

void SnapshotQuery::run_chunk(const std::vector<const std::string*>& chunk, int64_t start_ns,
                              int64_t end_ns, std::map<std::string, SnapshotRow>& out) const {
    Statement stmt = store_.prepare(snapshot_sql(chunk.size()));
    stmt.bind(1, start_ns).bind(2, end_ns);
    for (size_t i = 0; i < chunk.size(); ++i) {
        stmt.bind(static_cast<int>(i + 3), *chunk[i]);
    }

    while (stmt.step()) {
        SnapshotRow row;
        row.obs.instrument_id = stmt.column_text(0);
        row.obs.ts_ns = stmt.column_int64(1);

        TickFields& f = row.obs.fields;
        f.last_price = stmt.column_double(2);
        f.prev_close = stmt.column_double(3);
        f.open_interest = stmt.column_double(4);
        f.implied_vol = stmt.column_double(5);
        f.delta = stmt.column_double(6);
        f.gamma = stmt.column_double(7);
        f.vega = stmt.column_double(8);
        f.theta = stmt.column_double(9);

        row.change_pct = change_pct(f.last_price, stmt.column_optional_double(3));

        std::string key = row.obs.instrument_id;
        out[std::move(key)] = std::move(row);
    }
}

} // namespace optick
