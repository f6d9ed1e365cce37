#pragma once

#include "common/ring.hpp"
#include "common/tick.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace optick {

class TickStore;

struct WriterOptions {
    size_t batch_size = 64;
    std::chrono::milliseconds flush_interval{100};   // flush a partial batch after this
    std::chrono::milliseconds enqueue_wait{20};      // max producer stall on a full ring
    std::chrono::microseconds idle_sleep{200};
};

struct WriterStats {
    uint64_t accepted = 0;
    uint64_t dropped_full = 0;
    uint64_t written = 0;
    uint64_t dropped_storage = 0;
    uint64_t batches = 0;
};

// Moves observations off the receive loop onto a dedicated writer thread.
//
// submit() is called by exactly one producer thread and never touches the
// store. The writer thread batches rows into one transaction per flush; a
// batch the store rejects is logged and dropped (at-most-once).
class PersistenceWriter {
public:
    static constexpr size_t RING_SIZE = 4096;  // bounds in-flight observations

    explicit PersistenceWriter(TickStore& store, WriterOptions opts = WriterOptions());
    ~PersistenceWriter();

    PersistenceWriter(const PersistenceWriter&) = delete;
    PersistenceWriter& operator=(const PersistenceWriter&) = delete;

    void start();

    using Clock = std::chrono::steady_clock;

    // Returns false when the observation was dropped because the ring stayed
    // full for enqueue_wait.
    bool submit(Observation&& obs);

    // Same, but waits for ring space only until deadline. A producer that
    // submits many observations at once shares one deadline across them, so
    // a full ring stalls it for at most one enqueue_wait in total.
    bool submit(Observation&& obs, Clock::time_point deadline);

    Clock::time_point enqueue_deadline() const { return Clock::now() + opts_.enqueue_wait; }

    // Drains what is already queued, flushes and joins. Idempotent.
    void stop();

    WriterStats stats() const;
    size_t backlog() const { return ring_->approx_size(); }

private:
    void run();
    void flush(TickBatch& batch);

    TickStore& store_;
    WriterOptions opts_;
    std::unique_ptr<SPSCRing<Observation, RING_SIZE>> ring_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_full_{0};
    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> dropped_storage_{0};
    std::atomic<uint64_t> batches_{0};
};

} // namespace optick
