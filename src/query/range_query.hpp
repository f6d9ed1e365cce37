#pragma once

#include "common/tick.hpp"
#include "common/timing.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace optick {

class TickStore;

struct SeriesPoint {
    int64_t ts_ns = 0;
    double value = 0.0;
};

struct ExplicitWindow {
    int64_t start_ns = 0;
    int64_t end_ns = 0;
};

// Last `minutes` before the reference instant of `reference_date`: now for
// today, the session close for a past date. minutes == 0 is the whole day.
struct RelativeWindow {
    int minutes = 0;
    Date reference_date;
};

using RangeWindow = std::variant<ExplicitWindow, RelativeWindow>;

// Ordered (timestamp, value) series of one field for one instrument.
class RangeQuery {
public:
    using Clock = std::function<int64_t()>;

    RangeQuery(const TickStore& store, SessionCalendar calendar = SessionCalendar(),
               Clock now = wall_clock_ns);

    // Strictly ascending by timestamp, all inside the resolved window. Empty
    // when nothing matches. Throws QueryError on bad arguments.
    std::vector<SeriesPoint> range(const std::string& instrument_id, Field field,
                                   const RangeWindow& window) const;

    ExplicitWindow resolve(const RangeWindow& window) const;

private:
    const TickStore& store_;
    SessionCalendar calendar_;
    Clock now_;
};

} // namespace optick
