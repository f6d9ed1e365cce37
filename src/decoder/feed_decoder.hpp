#pragma once

#include "common/tick.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace optick {

namespace feed {
class Feed;
}

enum class FrameKind {
    Initial,    // first snapshot after subscribing
    Live
};

struct RejectedEntry {
    std::string instrument_id;
    std::string reason;
};

struct TickFrame {
    FrameKind kind = FrameKind::Live;
    int64_t server_ts_ms = 0;
    std::map<std::string, TickFields> ticks;
    std::vector<RejectedEntry> rejected;
};

// market_info notice: segment -> status name (e.g. "NSE_FO" -> "NORMAL_OPEN")
struct StatusFrame {
    int64_t server_ts_ms = 0;
    std::map<std::string, std::string> segment_status;
};

using DecodedFrame = std::variant<TickFrame, StatusFrame>;

// Stateless protobuf frame decoder. No I/O, no logging, no clock reads.
class FeedDecoder {
public:
    // Throws DecodeError when the frame itself cannot be parsed. A damaged
    // instrument entry is reported in TickFrame::rejected instead.
    DecodedFrame decode(std::string_view bytes) const;

    // Flattens whichever feed variant is present; absent parts read as 0.0.
    static TickFields normalize(const feed::Feed& f);
};

} // namespace optick
