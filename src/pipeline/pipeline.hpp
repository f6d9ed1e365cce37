#pragma once

#include "src/decoder/feed_decoder.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace optick {

class MessageStream;
class PersistenceWriter;

enum class PipelineState {
    Unauthenticated,
    Connecting,
    Subscribed,
    Streaming,
    Closed,
    Failed
};

const char* state_to_str(PipelineState s);

struct PipelineStats {
    uint64_t frames = 0;
    uint64_t ticks = 0;
    uint64_t status_frames = 0;
    uint64_t decode_errors = 0;
    uint64_t rejected_entries = 0;
    uint64_t dropped = 0;           // writer refused (ring full)
};

// authorize -> connect -> subscribe -> receive loop, for one connection.
//
// The receive loop reads one frame at a time, decodes it and hands every
// tick to the writer without waiting for storage. No reconnect: the caller
// decides what to do once run() returns or throws.
class Pipeline {
public:
    // bearer credential -> stream URL; throws AuthError
    using Authorize = std::function<std::string(const std::string& credential)>;
    // stream URL -> open connection; throws ConnectionError
    using Connect = std::function<std::unique_ptr<MessageStream>(const std::string& url)>;
    using Clock = std::function<int64_t()>;

    struct Options {
        std::string mode = "full";
        std::string stream_url;      // non-empty: skip authorization
        Clock clock;                 // ingestion stamp source; wall clock when empty
    };

    Pipeline(std::set<std::string> subscriptions, PersistenceWriter& writer,
             Authorize authorize, Connect connect, Options opts);
    Pipeline(std::set<std::string> subscriptions, PersistenceWriter& writer,
             Authorize authorize, Connect connect)
        : Pipeline(std::move(subscriptions), writer, std::move(authorize), std::move(connect),
                   Options()) {}

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Returns once the stream closes cleanly (state Closed). AuthError and
    // ConnectionError are rethrown after the state becomes Failed.
    void run(const std::string& credential);

    // Thread-safe; ends a running receive loop with a clean close. A stop
    // issued before run() ends that run as soon as it has subscribed.
    void stop();

    PipelineState state() const { return state_.load(); }
    PipelineStats stats() const;
    std::string correlation_id() const;

private:
    void set_state(PipelineState s);
    void receive_loop(MessageStream& stream);
    void on_ticks(TickFrame& frame);
    void on_status(const StatusFrame& status);
    int64_t next_stamp();

    const std::set<std::string> subscriptions_;
    PersistenceWriter& writer_;
    Authorize authorize_;
    Connect connect_;
    Options opts_;
    FeedDecoder decoder_;

    std::atomic<PipelineState> state_{PipelineState::Unauthenticated};
    int64_t last_stamp_ = 0;

    mutable std::mutex mutex_;      // guards stream_, stop_requested_, correlation_id_
    MessageStream* stream_ = nullptr;
    bool stop_requested_ = false;
    std::string correlation_id_;

    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> status_frames_{0};
    std::atomic<uint64_t> decode_errors_{0};
    std::atomic<uint64_t> rejected_entries_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace optick
