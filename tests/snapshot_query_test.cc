#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "src/query/range_query.hpp"
#include "src/query/snapshot_query.hpp"
#include "src/store/tick_store.hpp"
#include "tests/test_support.hpp"

#include <sqlite3.h>

#include <chrono>

namespace optick {
namespace {

using testing_support::at;
using testing_support::kSessionDate;
using testing_support::TempDir;

Observation obs(int64_t ts, const std::string& id, double ltp, double cp) {
    TickFields f;
    f.last_price = ltp;
    f.prev_close = cp;
    f.open_interest = 5000.0;
    f.implied_vol = 0.15;
    return Observation(ts, id, f);
}

class SnapshotQueryTest : public ::testing::Test {
protected:
    SnapshotQueryTest() : store_(dir_.file("ticks.db")) {}

    TempDir dir_;
    TickStore store_;
};

TEST_F(SnapshotQueryTest, LatestRowInsideWindow) {
    store_.append({obs(at(9, 15), "X", 100.0, 95.0), obs(at(9, 16), "X", 102.0, 95.0)});

    const auto rows = SnapshotQuery(store_).snapshot({"X"}, at(9, 0), at(9, 20));
    ASSERT_EQ(rows.size(), 1u);

    const SnapshotRow& r = rows.at("X");
    EXPECT_EQ(r.obs.ts_ns, at(9, 16));
    EXPECT_DOUBLE_EQ(r.obs.fields.last_price, 102.0);
    EXPECT_NEAR(r.change_pct, 7.368421, 1e-5);
}

TEST_F(SnapshotQueryTest, WindowBoundsAreInclusive) {
    store_.append({obs(at(9, 15), "X", 100.0, 95.0), obs(at(9, 16), "X", 102.0, 95.0)});

    const auto rows = SnapshotQuery(store_).snapshot({"X"}, at(9, 0), at(9, 15));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows.at("X").obs.ts_ns, at(9, 15));
}

TEST_F(SnapshotQueryTest, InstrumentsWithoutDataAreOmitted) {
    store_.append({obs(at(9, 15), "X", 100.0, 95.0), obs(at(10, 30), "Y", 50.0, 40.0)});

    const auto rows = SnapshotQuery(store_).snapshot({"X", "Y", "Z"}, at(9, 0), at(9, 30));
    EXPECT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows.count("X"), 1u);
    EXPECT_EQ(rows.count("Y"), 0u);
    EXPECT_EQ(rows.count("Z"), 0u);
}

TEST_F(SnapshotQueryTest, DuplicateTimestampLaterInsertWins) {
    store_.append(obs(at(9, 15), "X", 100.0, 95.0));
    store_.append(obs(at(9, 15), "X", 101.0, 95.0));

    const auto rows = SnapshotQuery(store_).snapshot({"X"}, at(9, 0), at(9, 20));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows.at("X").obs.fields.last_price, 101.0);
}

TEST_F(SnapshotQueryTest, EmptyIdSetReturnsEmpty) {
    store_.append(obs(at(9, 15), "X", 100.0, 95.0));
    EXPECT_TRUE(SnapshotQuery(store_).snapshot({}, at(9, 0), at(9, 20)).empty());
}

TEST_F(SnapshotQueryTest, InvertedWindowIsRejected) {
    EXPECT_THROW(SnapshotQuery(store_).snapshot({"X"}, at(9, 20), at(9, 0)), QueryError);
}

TEST_F(SnapshotQueryTest, MissingPrevCloseGivesZeroChange) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(dir_.file("ticks.db").c_str(), &db), SQLITE_OK);
    const std::string sql = "INSERT INTO ticks (ts_ns, instrument_key, ltp, cp) VALUES (" +
                            std::to_string(at(9, 15)) + ", 'X', 100.0, NULL)";
    ASSERT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    const auto rows = SnapshotQuery(store_).snapshot({"X"}, at(9, 0), at(9, 20));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows.at("X").change_pct, 0.0);
    EXPECT_DOUBLE_EQ(rows.at("X").obs.fields.prev_close, 0.0);
    EXPECT_DOUBLE_EQ(rows.at("X").obs.fields.delta, 0.0);
}

TEST_F(SnapshotQueryTest, SpansMoreIdsThanOneStatementBinds) {
    std::vector<Observation> rows;
    std::set<std::string> ids;
    for (size_t i = 0; i < SnapshotQuery::CHUNK * 2 + 3; ++i) {
        const std::string id = "NSE_FO|" + std::to_string(i);
        ids.insert(id);
        rows.push_back(obs(at(9, 15), id, 10.0, 10.0));
    }
    store_.append(rows);

    const auto result = SnapshotQuery(store_).snapshot(ids, at(9, 0), at(9, 20));
    EXPECT_EQ(result.size(), ids.size());
}

TEST_F(SnapshotQueryTest, ReadOnlyConnectionSeesCommittedRows) {
    store_.append(obs(at(9, 15), "X", 100.0, 95.0));

    TickStore reader(dir_.file("ticks.db"), TickStore::Mode::ReadOnly);
    const auto rows = SnapshotQuery(reader).snapshot({"X"}, at(9, 0), at(9, 20));
    EXPECT_EQ(rows.size(), 1u);
}

TEST_F(SnapshotQueryTest, ReadersAreNotBlockedByAnOpenWriteTransaction) {
    store_.append({obs(at(9, 15), "X", 100.0, 95.0), obs(at(9, 16), "X", 101.0, 95.0)});

    // a second writer holds the write lock with an uncommitted, later row
    sqlite3* writer = nullptr;
    ASSERT_EQ(sqlite3_open(dir_.file("ticks.db").c_str(), &writer), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(writer, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), SQLITE_OK);
    const std::string insert = "INSERT INTO ticks (ts_ns, instrument_key, ltp, cp) VALUES (" +
                               std::to_string(at(9, 17)) + ", 'X', 250.0, 95.0)";
    ASSERT_EQ(sqlite3_exec(writer, insert.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);

    TickStore reader(dir_.file("ticks.db"), TickStore::Mode::ReadOnly, 2000);
    const auto start = std::chrono::steady_clock::now();

    const auto rows = SnapshotQuery(reader).snapshot({"X"}, at(9, 0), at(9, 30));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows.at("X").obs.ts_ns, at(9, 16));
    EXPECT_DOUBLE_EQ(rows.at("X").obs.fields.last_price, 101.0);

    const RangeQuery range(reader, SessionCalendar(), []() { return at(9, 30); });
    const auto series = range.range("X", Field::LastPrice, RelativeWindow{30, kSessionDate});
    ASSERT_EQ(series.size(), 2u);
    EXPECT_DOUBLE_EQ(series.back().value, 101.0);

    // well under the reader's busy timeout: nothing waited on the lock
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1000));

    EXPECT_EQ(sqlite3_exec(writer, "ROLLBACK", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(writer);
}

}  // namespace
}  // namespace optick
