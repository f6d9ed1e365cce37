#pragma once

#include <cstddef>
#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace optick {

// Stored numeric columns plus the derived change percentage
enum class Field : uint32_t {
    LastPrice = 0,
    PrevClose = 1,
    OpenInterest = 2,
    ImpliedVol = 3,
    Delta = 4,
    Gamma = 5,
    Vega = 6,
    Theta = 7,
    ChangePct = 8,
    COUNT = 9
};

inline const char* field_to_str(Field f) {
    static constexpr std::array<const char*, 9> names = {
        "ltp", "cp", "oi", "iv", "delta", "gamma", "vega", "theta", "chg_pct"
    };
    return names[static_cast<uint32_t>(f)];
}

inline std::optional<Field> field_from_str(std::string_view name) {
    for (uint32_t i = 0; i < static_cast<uint32_t>(Field::COUNT); ++i) {
        if (name == field_to_str(static_cast<Field>(i))) {
            return static_cast<Field>(i);
        }
    }
    return std::nullopt;
}

// (ltp - cp) / cp * 100, zero when cp is missing or exactly zero
inline double change_pct(double last_price, std::optional<double> prev_close) {
    if (!prev_close || *prev_close == 0.0) {
        return 0.0;
    }
    return (last_price - *prev_close) / *prev_close * 100.0;
}

// Normalized per-instrument values from one feed entry.
// Every member defaults to zero when the feed omits it.
struct TickFields {
    double last_price = 0.0;
    double prev_close = 0.0;
    double open_interest = 0.0;
    double implied_vol = 0.0;
    double delta = 0.0;
    double gamma = 0.0;
    double vega = 0.0;
    double theta = 0.0;

    double get(Field f) const {
        switch (f) {
            case Field::LastPrice:    return last_price;
            case Field::PrevClose:    return prev_close;
            case Field::OpenInterest: return open_interest;
            case Field::ImpliedVol:   return implied_vol;
            case Field::Delta:        return delta;
            case Field::Gamma:        return gamma;
            case Field::Vega:         return vega;
            case Field::Theta:        return theta;
            case Field::ChangePct:    return change_pct(last_price, prev_close);
            default:                  return 0.0;
        }
    }
};

// One stored row. Immutable once appended.
struct Observation {
    int64_t ts_ns = 0;          // ingestion wall clock, ns since epoch (UTC)
    std::string instrument_id;
    TickFields fields;

    Observation() = default;

    Observation(int64_t ts, std::string id, const TickFields& f)
        : ts_ns(ts), instrument_id(std::move(id)), fields(f) {}
};

// Batch container for transactional store appends
class TickBatch {
public:
    explicit TickBatch(size_t capacity) : capacity_(capacity) {
        ticks_.reserve(capacity);
    }

    bool is_full() const { return ticks_.size() >= capacity_; }
    bool is_empty() const { return ticks_.empty(); }

    void push(Observation&& t) {
        if (ticks_.size() < capacity_) {
            ticks_.push_back(std::move(t));
        }
    }

    void clear() { ticks_.clear(); }

    const std::vector<Observation>& rows() const { return ticks_; }
    size_t size() const { return ticks_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::vector<Observation> ticks_;
};

} // namespace optick
