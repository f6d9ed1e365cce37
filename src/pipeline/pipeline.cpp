#include "src/pipeline/pipeline.hpp"

#include "common/errors.hpp"
#include "common/timing.hpp"
#include "src/pipeline/message_stream.hpp"
#include "src/pipeline/subscription.hpp"
#include "src/pipeline/url.hpp"
#include "src/writer/persistence_writer.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>
#include <variant>

namespace optick {

const char* state_to_str(PipelineState s) {
    switch (s) {
        case PipelineState::Unauthenticated: return "Unauthenticated";
        case PipelineState::Connecting:      return "Connecting";
        case PipelineState::Subscribed:      return "Subscribed";
        case PipelineState::Streaming:       return "Streaming";
        case PipelineState::Closed:          return "Closed";
        case PipelineState::Failed:          return "Failed";
    }
    return "Unknown";
}

Pipeline::Pipeline(std::set<std::string> subscriptions, PersistenceWriter& writer,
                   Authorize authorize, Connect connect, Options opts)
    : subscriptions_(std::move(subscriptions)),
      writer_(writer),
      authorize_(std::move(authorize)),
      connect_(std::move(connect)),
      opts_(std::move(opts)) {
    if (subscriptions_.empty()) {
        throw std::invalid_argument("pipeline needs at least one instrument to subscribe to");
    }
    if (!opts_.clock) {
        opts_.clock = wall_clock_ns;
    }
}

void Pipeline::set_state(PipelineState s) {
    const PipelineState prev = state_.exchange(s);
    spdlog::debug("Pipeline state {} -> {}", state_to_str(prev), state_to_str(s));
}

void Pipeline::run(const std::string& credential) {
    std::unique_ptr<MessageStream> stream;

    try {
        set_state(PipelineState::Unauthenticated);
        std::string url = opts_.stream_url;
        if (url.empty()) {
            url = authorize_(credential);
            // the redirect query carries a one-time code; log the host only
            const auto parsed = parse_url(url);
            spdlog::info("Authorized, stream endpoint {}", parsed ? parsed->host : "<unparsed>");
        }

        set_state(PipelineState::Connecting);
        stream = connect_(url);

        const std::string guid = make_correlation_id();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            correlation_id_ = guid;
            stream_ = stream.get();
        }
        stream->send_binary(build_subscription(guid, opts_.mode, subscriptions_));
        spdlog::info("Subscribed to {} instruments (mode {}, guid {})",
                     subscriptions_.size(), opts_.mode, guid);
        set_state(PipelineState::Subscribed);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                stream->shutdown();
            }
        }

        set_state(PipelineState::Streaming);
        receive_loop(*stream);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stream_ = nullptr;
            stop_requested_ = false;
        }
        set_state(PipelineState::Failed);
        spdlog::error("Pipeline failed: {}", e.what());
        throw;
    }

    {
        // a stop is consumed by the run it ended; the next run starts fresh
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = nullptr;
        stop_requested_ = false;
    }
    set_state(PipelineState::Closed);

    const PipelineStats s = stats();
    spdlog::info("Stream closed. Frames: {}, ticks: {}, status: {}, decode errors: {}, "
                 "rejected entries: {}, dropped: {}", s.frames, s.ticks, s.status_frames,
                 s.decode_errors, s.rejected_entries, s.dropped);
}

void Pipeline::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    if (stream_) {
        stream_->shutdown();
    }
}

void Pipeline::receive_loop(MessageStream& stream) {
    std::string message;

    while (stream.read(message)) {
        const uint64_t frames = ++frames_;

        DecodedFrame decoded;
        try {
            decoded = decoder_.decode(message);
        } catch (const DecodeError& e) {
            const uint64_t errors = ++decode_errors_;
            spdlog::warn("Skipping frame {} ({} decode errors so far): {}", frames, errors, e.what());
            continue;
        }

        if (auto* ticks = std::get_if<TickFrame>(&decoded)) {
            on_ticks(*ticks);
        } else {
            on_status(std::get<StatusFrame>(decoded));
        }

        // Periodic stats
        if (frames % 1000 == 0) {
            spdlog::info("Frames: {} | Ticks: {} | Drops: {} | Ring: {}/{}",
                         frames, ticks_.load(), dropped_.load(),
                         writer_.backlog(), PersistenceWriter::RING_SIZE - 1);
        }
    }
}

int64_t Pipeline::next_stamp() {
    // strictly increasing, so every frame totally orders its instruments' rows
    int64_t ts = opts_.clock();
    if (ts <= last_stamp_) {
        ts = last_stamp_ + 1;
    }
    last_stamp_ = ts;
    return ts;
}

void Pipeline::on_ticks(TickFrame& frame) {
    for (const RejectedEntry& r : frame.rejected) {
        ++rejected_entries_;
        spdlog::warn("Rejected feed entry for '{}': {}", r.instrument_id, r.reason);
    }
    if (frame.ticks.empty()) {
        return;
    }

    const int64_t stamp = next_stamp();
    // one ring wait per frame, however many instruments it carries
    const auto deadline = writer_.enqueue_deadline();
    for (auto& kv : frame.ticks) {
        Observation obs(stamp, kv.first, kv.second);
        if (writer_.submit(std::move(obs), deadline)) {
            ++ticks_;
        } else {
            ++dropped_;
        }
    }
}

void Pipeline::on_status(const StatusFrame& status) {
    ++status_frames_;
    for (const auto& kv : status.segment_status) {
        spdlog::info("Market status {}: {}", kv.first, kv.second);
    }
}

PipelineStats Pipeline::stats() const {
    PipelineStats s;
    s.frames = frames_.load();
    s.ticks = ticks_.load();
    s.status_frames = status_frames_.load();
    s.decode_errors = decode_errors_.load();
    s.rejected_entries = rejected_entries_.load();
    s.dropped = dropped_.load();
    return s;
}

std::string Pipeline::correlation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

} // namespace optick
