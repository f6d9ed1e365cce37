#pragma once

#include "common/tick.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace optick {

class TickStore;

struct SnapshotRow {
    Observation obs;
    double change_pct = 0.0;    // derived at read time, never stored
};

// "Latest row per instrument inside [start, end]" over the
// (instrument_key, ts_ns) index. Read-only.
class SnapshotQuery {
public:
    // ids bound per statement; keeps well under SQLite's parameter limit
    static constexpr size_t CHUNK = 256;

    explicit SnapshotQuery(const TickStore& store) : store_(store) {}

    // Instruments without an observation in the window are absent from the
    // result. Throws QueryError when start_ns > end_ns.
    std::map<std::string, SnapshotRow> snapshot(const std::set<std::string>& ids,
                                                int64_t start_ns, int64_t end_ns) const;

private:
    void run_chunk(const std::vector<const std::string*>& chunk, int64_t start_ns,
                   int64_t end_ns, std::map<std::string, SnapshotRow>& out) const;

    const TickStore& store_;
};

} // namespace optick
