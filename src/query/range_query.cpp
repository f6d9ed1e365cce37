#include "src/query/range_query.hpp"

#include "common/errors.hpp"
#include "src/store/tick_store.hpp"

#include <string>
#include <utility>

namespace optick {

namespace {

const char* column_for(Field field) {
    switch (field) {
        case Field::LastPrice:    return "ltp";
        case Field::PrevClose:    return "cp";
        case Field::OpenInterest: return "oi";
        case Field::ImpliedVol:   return "iv";
        case Field::Delta:        return "delta";
        case Field::Gamma:        return "gamma";
        case Field::Vega:         return "vega";
        case Field::Theta:        return "theta";
        default:                  return nullptr;
    }
}

} // namespace

RangeQuery::RangeQuery(const TickStore& store, SessionCalendar calendar, Clock now)
    : store_(store), calendar_(calendar), now_(std::move(now)) {}

ExplicitWindow RangeQuery::resolve(const RangeWindow& window) const {
    if (const auto* w = std::get_if<ExplicitWindow>(&window)) {
        if (w->start_ns > w->end_ns) {
            throw QueryError("range window start is after end");
        }
        return *w;
    }

    const RelativeWindow& rel = std::get<RelativeWindow>(window);
    if (rel.minutes < 0) {
        throw QueryError("range window minutes must not be negative");
    }

    const int64_t now = now_();
    const Date today = calendar_.local_date(now);

    int64_t reference = 0;
    if (rel.reference_date == today) {
        reference = now;
    } else if (rel.reference_date < today) {
        // "now" would put a historical day entirely outside the window
        reference = calendar_.session_close_ns(rel.reference_date);
    } else {
        throw QueryError("range reference date is in the future");
    }

    // the window may not reach back before the epoch
    if (static_cast<int64_t>(rel.minutes) > reference / NS_PER_MIN) {
        throw QueryError("range window of " + std::to_string(rel.minutes) +
                         " minutes reaches before the epoch");
    }

    ExplicitWindow resolved;
    resolved.end_ns = reference;
    resolved.start_ns = rel.minutes == 0
        ? calendar_.day_start_ns(rel.reference_date)
        : reference - static_cast<int64_t>(rel.minutes) * NS_PER_MIN;
    if (resolved.start_ns > resolved.end_ns) {
        throw QueryError("range window start is after end");
    }
    return resolved;
}

std::vector<SeriesPoint> RangeQuery::range(const std::string& instrument_id, Field field,
                                           const RangeWindow& window) const {
    if (instrument_id.empty()) {
        throw QueryError("range query needs an instrument id");
    }
    if (field == Field::COUNT) {
        throw QueryError("range query needs a field");
    }

    const ExplicitWindow w = resolve(window);
    const bool derived = field == Field::ChangePct;

    std::string sql = "SELECT ts_ns, ";
    sql += derived ? "ltp, cp" : column_for(field);
    sql += " FROM ticks WHERE instrument_key = ?1 AND ts_ns BETWEEN ?2 AND ?3 "
           "ORDER BY ts_ns, rowid";

    Statement stmt = store_.prepare(sql);
    stmt.bind(1, instrument_id).bind(2, w.start_ns).bind(3, w.end_ns);

    std::vector<SeriesPoint> series;
    while (stmt.step()) {
        SeriesPoint p;
        p.ts_ns = stmt.column_int64(0);
        p.value = derived ? change_pct(stmt.column_double(1), stmt.column_optional_double(2))
                          : stmt.column_double(1);

        // same timestamp twice: the later insert wins
        if (!series.empty() && series.back().ts_ns == p.ts_ns) {
            series.back() = p;
        } else {
            series.push_back(p);
        }
    }
    return series;
}

} // namespace optick
