#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "market_feed.pb.h"
#include "src/decoder/feed_decoder.hpp"

namespace optick {
namespace {

feed::Feed full_option_feed(double ltp, double cp, bool with_greeks = true) {
    feed::Feed f;
    feed::MarketFullFeed* m = f.mutable_full_feed()->mutable_market_ff();
    m->mutable_ltpc()->set_ltp(ltp);
    m->mutable_ltpc()->set_cp(cp);
    m->set_oi(125000.0);
    m->set_iv(0.1432);
    if (with_greeks) {
        m->mutable_option_greeks()->set_delta(0.52);
        m->mutable_option_greeks()->set_gamma(0.0011);
        m->mutable_option_greeks()->set_vega(11.8);
        m->mutable_option_greeks()->set_theta(-7.25);
    }
    return f;
}

const TickFrame& as_ticks(const DecodedFrame& d) {
    return std::get<TickFrame>(d);
}

TEST(FeedDecoderTest, DecodesOneObservationPerEntry) {
    feed::FeedResponse msg;
    msg.set_type(feed::LIVE_FEED);
    msg.set_current_ts(1704858300000);
    (*msg.mutable_feeds())["NSE_FO|1001"] = full_option_feed(102.0, 95.0);
    (*msg.mutable_feeds())["NSE_FO|1002"] = full_option_feed(48.5, 51.0);
    (*msg.mutable_feeds())["NSE_FO|1003"] = full_option_feed(7.05, 6.0);

    const FeedDecoder decoder;
    const DecodedFrame d = decoder.decode(msg.SerializeAsString());
    const TickFrame& frame = as_ticks(d);

    EXPECT_EQ(frame.kind, FrameKind::Live);
    EXPECT_EQ(frame.server_ts_ms, 1704858300000);
    EXPECT_TRUE(frame.rejected.empty());
    ASSERT_EQ(frame.ticks.size(), 3u);

    const TickFields& f = frame.ticks.at("NSE_FO|1001");
    EXPECT_DOUBLE_EQ(f.last_price, 102.0);
    EXPECT_DOUBLE_EQ(f.prev_close, 95.0);
    EXPECT_DOUBLE_EQ(f.open_interest, 125000.0);
    EXPECT_DOUBLE_EQ(f.implied_vol, 0.1432);
    EXPECT_DOUBLE_EQ(f.delta, 0.52);
    EXPECT_DOUBLE_EQ(f.gamma, 0.0011);
    EXPECT_DOUBLE_EQ(f.vega, 11.8);
    EXPECT_DOUBLE_EQ(f.theta, -7.25);
}

TEST(FeedDecoderTest, DecodingIsDeterministic) {
    feed::FeedResponse msg;
    msg.set_type(feed::INITIAL_FEED);
    (*msg.mutable_feeds())["NSE_FO|1001"] = full_option_feed(102.0, 95.0);
    const std::string bytes = msg.SerializeAsString();

    const FeedDecoder decoder;
    const TickFrame a = as_ticks(decoder.decode(bytes));
    const TickFrame b = as_ticks(decoder.decode(bytes));

    EXPECT_EQ(a.kind, FrameKind::Initial);
    ASSERT_EQ(a.ticks.size(), b.ticks.size());
    EXPECT_DOUBLE_EQ(a.ticks.at("NSE_FO|1001").last_price, b.ticks.at("NSE_FO|1001").last_price);
    EXPECT_DOUBLE_EQ(a.ticks.at("NSE_FO|1001").theta, b.ticks.at("NSE_FO|1001").theta);
}

TEST(FeedDecoderTest, MalformedEntryDoesNotSinkTheFrame) {
    feed::FeedResponseEnvelope env;
    env.set_type(feed::LIVE_FEED);
    for (const char* key : {"NSE_FO|1", "NSE_FO|2"}) {
        feed::FeedEntryBytes* e = env.add_feeds();
        e->set_key(key);
        e->set_value(full_option_feed(10.0, 9.0).SerializeAsString());
    }
    // length prefix runs past the end of the entry
    feed::FeedEntryBytes* bad = env.add_feeds();
    bad->set_key("NSE_FO|3");
    bad->set_value(std::string("\x0a\x10\x01", 3));

    const FeedDecoder decoder;
    const TickFrame frame = as_ticks(decoder.decode(env.SerializeAsString()));

    EXPECT_EQ(frame.ticks.size(), 2u);
    EXPECT_EQ(frame.ticks.count("NSE_FO|3"), 0u);
    ASSERT_EQ(frame.rejected.size(), 1u);
    EXPECT_EQ(frame.rejected[0].instrument_id, "NSE_FO|3");
}

TEST(FeedDecoderTest, NonUtf8KeyIsRejectedAlone) {
    feed::FeedResponseEnvelope env;
    env.set_type(feed::LIVE_FEED);
    for (const std::string& key : {std::string("NSE_FO|1"), std::string("NSE_FO|\xff\xfe"),
                                   std::string("NSE_FO|2")}) {
        feed::FeedEntryBytes* e = env.add_feeds();
        e->set_key(key);
        e->set_value(full_option_feed(10.0, 9.0).SerializeAsString());
    }

    const TickFrame frame = as_ticks(FeedDecoder().decode(env.SerializeAsString()));

    EXPECT_EQ(frame.ticks.size(), 2u);
    EXPECT_EQ(frame.ticks.count("NSE_FO|1"), 1u);
    EXPECT_EQ(frame.ticks.count("NSE_FO|2"), 1u);
    ASSERT_EQ(frame.rejected.size(), 1u);
    EXPECT_EQ(frame.rejected[0].instrument_id, "NSE_FO|\xff\xfe");
    EXPECT_EQ(frame.rejected[0].reason, "invalid instrument key");
}

TEST(FeedDecoderTest, MultibyteKeyIsAccepted) {
    feed::FeedResponseEnvelope env;
    env.set_type(feed::LIVE_FEED);
    feed::FeedEntryBytes* e = env.add_feeds();
    e->set_key("NSE_FO|\xe2\x82\xb9");    // U+20B9
    e->set_value(full_option_feed(10.0, 9.0).SerializeAsString());

    const TickFrame frame = as_ticks(FeedDecoder().decode(env.SerializeAsString()));
    EXPECT_EQ(frame.ticks.size(), 1u);
    EXPECT_TRUE(frame.rejected.empty());
}

TEST(FeedDecoderTest, EmptyKeyIsRejected) {
    feed::FeedResponseEnvelope env;
    env.set_type(feed::LIVE_FEED);
    feed::FeedEntryBytes* e = env.add_feeds();
    e->set_value(full_option_feed(10.0, 9.0).SerializeAsString());

    const TickFrame frame = as_ticks(FeedDecoder().decode(env.SerializeAsString()));
    EXPECT_TRUE(frame.ticks.empty());
    EXPECT_EQ(frame.rejected.size(), 1u);
}

TEST(FeedDecoderTest, MissingGreeksReadAsZero) {
    feed::FeedResponse msg;
    msg.set_type(feed::LIVE_FEED);
    (*msg.mutable_feeds())["NSE_FO|1001"] = full_option_feed(102.0, 95.0, false);

    const TickFrame frame = as_ticks(FeedDecoder().decode(msg.SerializeAsString()));
    const TickFields& f = frame.ticks.at("NSE_FO|1001");
    EXPECT_DOUBLE_EQ(f.last_price, 102.0);
    EXPECT_DOUBLE_EQ(f.delta, 0.0);
    EXPECT_DOUBLE_EQ(f.gamma, 0.0);
    EXPECT_DOUBLE_EQ(f.vega, 0.0);
    EXPECT_DOUBLE_EQ(f.theta, 0.0);
}

TEST(FeedDecoderTest, LtpcAndFirstLevelVariants) {
    feed::FeedResponse msg;
    msg.set_type(feed::LIVE_FEED);

    feed::Feed ltpc;
    ltpc.mutable_ltpc()->set_ltp(21950.4);
    ltpc.mutable_ltpc()->set_cp(21900.0);
    (*msg.mutable_feeds())["NSE_INDEX|Nifty 50"] = ltpc;

    feed::Feed fl;
    fl.mutable_first_level_with_greeks()->mutable_ltpc()->set_ltp(88.0);
    fl.mutable_first_level_with_greeks()->mutable_option_greeks()->set_delta(-0.41);
    fl.mutable_first_level_with_greeks()->set_oi(5000.0);
    fl.mutable_first_level_with_greeks()->set_iv(0.2);
    (*msg.mutable_feeds())["NSE_FO|2002"] = fl;

    const TickFrame frame = as_ticks(FeedDecoder().decode(msg.SerializeAsString()));

    const TickFields& idx = frame.ticks.at("NSE_INDEX|Nifty 50");
    EXPECT_DOUBLE_EQ(idx.last_price, 21950.4);
    EXPECT_DOUBLE_EQ(idx.prev_close, 21900.0);
    EXPECT_DOUBLE_EQ(idx.open_interest, 0.0);

    const TickFields& opt = frame.ticks.at("NSE_FO|2002");
    EXPECT_DOUBLE_EQ(opt.last_price, 88.0);
    EXPECT_DOUBLE_EQ(opt.delta, -0.41);
    EXPECT_DOUBLE_EQ(opt.open_interest, 5000.0);
    EXPECT_DOUBLE_EQ(opt.implied_vol, 0.2);
}

TEST(FeedDecoderTest, EmptyFrameYieldsNoTicks) {
    feed::FeedResponse msg;
    msg.set_type(feed::LIVE_FEED);

    const TickFrame frame = as_ticks(FeedDecoder().decode(msg.SerializeAsString()));
    EXPECT_TRUE(frame.ticks.empty());
    EXPECT_TRUE(frame.rejected.empty());

    // zero bytes is a valid, empty message
    EXPECT_TRUE(as_ticks(FeedDecoder().decode("")).ticks.empty());
}

TEST(FeedDecoderTest, GarbageFrameThrows) {
    const FeedDecoder decoder;
    EXPECT_THROW(decoder.decode(std::string("\x12\x05" "ab", 4)), DecodeError);
}

TEST(FeedDecoderTest, MarketInfoBecomesStatusFrame) {
    feed::FeedResponse msg;
    msg.set_type(feed::MARKET_INFO);
    msg.set_current_ts(1704858000000);
    (*msg.mutable_market_info()->mutable_segment_status())["NSE_FO"] = feed::NORMAL_OPEN;

    const DecodedFrame d = FeedDecoder().decode(msg.SerializeAsString());
    ASSERT_TRUE(std::holds_alternative<StatusFrame>(d));
    const StatusFrame& s = std::get<StatusFrame>(d);
    EXPECT_EQ(s.server_ts_ms, 1704858000000);
    EXPECT_EQ(s.segment_status.at("NSE_FO"), "NORMAL_OPEN");
}

}  // namespace
}  // namespace optick
