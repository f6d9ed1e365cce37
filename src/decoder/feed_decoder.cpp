#include "src/decoder/feed_decoder.hpp"

#include "common/errors.hpp"
#include "market_feed.pb.h"

#include <limits>

namespace optick {

namespace {

void apply_ltpc(const feed::LTPC& ltpc, TickFields& out) {
    out.last_price = ltpc.ltp();
    out.prev_close = ltpc.cp();
}

void apply_greeks(const feed::OptionGreeks& g, TickFields& out) {
    out.delta = g.delta();
    out.gamma = g.gamma();
    out.vega = g.vega();
    out.theta = g.theta();
}

// Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF
bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        unsigned char lo = 0x80, hi = 0xbf;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xc2 && c <= 0xdf) {
            extra = 1;
        } else if (c >= 0xe0 && c <= 0xef) {
            extra = 2;
            if (c == 0xe0) lo = 0xa0;
            if (c == 0xed) hi = 0x9f;
        } else if (c >= 0xf0 && c <= 0xf4) {
            extra = 3;
            if (c == 0xf0) lo = 0x90;
            if (c == 0xf4) hi = 0x8f;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            const unsigned char min = k == 1 ? lo : 0x80;
            const unsigned char max = k == 1 ? hi : 0xbf;
            if (cc < min || cc > max) return false;
        }
        i += extra + 1;
    }
    return true;
}

StatusFrame to_status(const feed::FeedResponseEnvelope& env) {
    StatusFrame status;
    status.server_ts_ms = env.current_ts();
    for (const auto& kv : env.market_info().segment_status()) {
        const auto value = static_cast<feed::MarketStatus>(kv.second);
        const std::string& name = feed::MarketStatus_Name(value);
        status.segment_status[kv.first] = name.empty() ? std::to_string(kv.second) : name;
    }
    return status;
}

} // namespace

TickFields FeedDecoder::normalize(const feed::Feed& f) {
    TickFields out;

    switch (f.feed_union_case()) {
        case feed::Feed::kLtpc:
            apply_ltpc(f.ltpc(), out);
            break;

        case feed::Feed::kFullFeed: {
            const feed::FullFeed& full = f.full_feed();
            if (full.has_market_ff()) {
                const feed::MarketFullFeed& m = full.market_ff();
                apply_ltpc(m.ltpc(), out);
                apply_greeks(m.option_greeks(), out);
                out.open_interest = m.oi();
                out.implied_vol = m.iv();
            } else if (full.has_index_ff()) {
                apply_ltpc(full.index_ff().ltpc(), out);
            }
            break;
        }

        case feed::Feed::kFirstLevelWithGreeks: {
            const feed::FirstLevelWithGreeks& fl = f.first_level_with_greeks();
            apply_ltpc(fl.ltpc(), out);
            apply_greeks(fl.option_greeks(), out);
            out.open_interest = fl.oi();
            out.implied_vol = fl.iv();
            break;
        }

        case feed::Feed::FEED_UNION_NOT_SET:
            break;
    }

    return out;
}

DecodedFrame FeedDecoder::decode(std::string_view bytes) const {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DecodeError("frame too large: " + std::to_string(bytes.size()) + " bytes");
    }

    feed::FeedResponseEnvelope env;
    if (!env.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw DecodeError("malformed feed frame (" + std::to_string(bytes.size()) + " bytes)");
    }

    if (env.type() == feed::MARKET_INFO) {
        return to_status(env);
    }

    TickFrame frame;
    frame.kind = env.type() == feed::INITIAL_FEED ? FrameKind::Initial : FrameKind::Live;
    frame.server_ts_ms = env.current_ts();

    for (const feed::FeedEntryBytes& entry : env.feeds()) {
        if (entry.key().empty()) {
            frame.rejected.push_back({entry.key(), "empty instrument key"});
            continue;
        }

        if (!is_valid_utf8(entry.key())) {
            frame.rejected.push_back({entry.key(), "invalid instrument key"});
            continue;
        }

        feed::Feed f;
        if (!f.ParseFromString(entry.value())) {
            frame.rejected.push_back({entry.key(), "malformed feed entry"});
            continue;
        }

        // map semantics: a repeated key keeps the last entry
        frame.ticks[entry.key()] = normalize(f);
    }

    return frame;
}

} // namespace optick
