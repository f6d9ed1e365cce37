#include "src/writer/persistence_writer.hpp"

#include "common/errors.hpp"
#include "common/timing.hpp"
#include "src/store/tick_store.hpp"

#include <spdlog/spdlog.h>

namespace optick {

PersistenceWriter::PersistenceWriter(TickStore& store, WriterOptions opts)
    : store_(store),
      opts_(opts),
      ring_(std::make_unique<SPSCRing<Observation, RING_SIZE>>()) {
    if (opts_.batch_size == 0) {
        opts_.batch_size = 1;
    }
}

PersistenceWriter::~PersistenceWriter() {
    stop();
}

void PersistenceWriter::start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Writer thread starting, store {} (batch {}, flush {} ms)",
                 store_.path(), opts_.batch_size, opts_.flush_interval.count());
    thread_ = std::thread(&PersistenceWriter::run, this);
}

bool PersistenceWriter::submit(Observation&& obs) {
    return submit(std::move(obs), enqueue_deadline());
}

bool PersistenceWriter::submit(Observation&& obs, Clock::time_point deadline) {
    if (ring_->try_push(std::move(obs))) {
        ++accepted_;
        return true;
    }

    while (Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        if (ring_->try_push(std::move(obs))) {
            ++accepted_;
            return true;
        }
    }

    const uint64_t drops = ++dropped_full_;
    if (drops == 1 || drops % 1000 == 0) {
        spdlog::warn("Ring full, drops: {}", drops);
    }
    return false;
}

void PersistenceWriter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    const WriterStats s = stats();
    spdlog::info("Writer thread exiting. Batches: {}, written: {}, dropped (ring full): {}, "
                 "dropped (storage): {}", s.batches, s.written, s.dropped_full, s.dropped_storage);
}

WriterStats PersistenceWriter::stats() const {
    WriterStats s;
    s.accepted = accepted_.load();
    s.dropped_full = dropped_full_.load();
    s.written = written_.load();
    s.dropped_storage = dropped_storage_.load();
    s.batches = batches_.load();
    return s;
}

void PersistenceWriter::flush(TickBatch& batch) {
    if (batch.is_empty()) return;

    const size_t n = batch.size();
    const uint64_t t0 = get_timestamp_ns();
    try {
        store_.append(batch.rows());
        const uint64_t t1 = get_timestamp_ns();

        written_ += n;
        const uint64_t batches = ++batches_;
        if (batches % 100 == 0) {
            spdlog::info("Batches: {} | Ticks: {} | Last batch latency: {:.2f} us | Ring: {}/{}",
                         batches, written_.load(), ns_to_us(t1 - t0),
                         ring_->approx_size(), ring_->capacity());
        }
    } catch (const StorageError& e) {
        dropped_storage_ += n;
        spdlog::warn("Dropped batch of {} ticks ({}, sqlite code {}): {}", n,
                     e.busy() ? "store busy" : "store error", e.code(), e.what());
    }
    batch.clear();
}

void PersistenceWriter::run() {
    TickBatch batch(opts_.batch_size);
    auto last_flush = std::chrono::steady_clock::now();

    // keep draining after stop() so queued observations are not abandoned
    while (running_.load() || !ring_->is_empty()) {
        Observation obs;

        if (ring_->try_pop(obs)) {
            batch.push(std::move(obs));

            if (batch.is_full()) {
                flush(batch);
                last_flush = std::chrono::steady_clock::now();
            }
        } else {
            // Ring empty - check for timeout flush
            auto now = std::chrono::steady_clock::now();
            if (!batch.is_empty() && (now - last_flush) > opts_.flush_interval) {
                flush(batch);
                last_flush = now;
            }

            if (running_.load()) {
                std::this_thread::sleep_for(opts_.idle_sleep);
            }
        }
    }

    // Final flush
    flush(batch);
}

} // namespace optick
