#pragma once

// kvs.h — kvs streaming telemetry runtime
//
// Core data model shared by the line decoder, the stream pump and the
// render selector: error taxonomy, tick timer, pump statistics, the signal
// registry and the sample store.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace kvs {

// ── Errors ──────────────────────────────────────────────────────────────────

enum class ConfigError { None, InvalidWindowSize };

inline const char *config_error_str(ConfigError e) {
    switch (e) {
    case ConfigError::None:
        return "ok";
    case ConfigError::InvalidWindowSize:
        return "invalid window size (must be > 0)";
    }
    return "unknown";
}

/// Window size is a caller-side setting; nothing below the render tick
/// applies a default.
inline ConfigError validate_window_size(double window_size) {
    if (!std::isfinite(window_size) || window_size <= 0.0)
        return ConfigError::InvalidWindowSize;
    return ConfigError::None;
}

enum class StoreErrc { NotFound };

/// Thrown when the sample store is addressed with a name the registry never
/// saw. This is a registry/store coordination bug, not an input error.
class StoreError : public std::logic_error {
    StoreErrc code_;

  public:
    StoreError(StoreErrc code, std::string_view name)
        : std::logic_error("kvs: signal not registered: '" + std::string(name) + "'"),
          code_(code) {}

    StoreErrc code() const { return code_; }
};

// ── Decoded record ──────────────────────────────────────────────────────────

/// One decoded wire line. `samples` holds every non-"Time" key once, in the
/// order the key first appeared on the line.
struct DecodedLine {
    double timestamp = 0.0;
    std::vector<std::pair<std::string, double>> samples;
    uint32_t malformed_fields = 0;
};

// ── Timer (fixed-spacing tick generator) ────────────────────────────────────

class Timer {
    using Clock = std::chrono::steady_clock;
    using Nanos = std::chrono::nanoseconds;

    Nanos period_;
    Clock::time_point next_;
    bool overrun_ = false;
    Nanos last_latency_{0};

  public:
    explicit Timer(double freq_hz)
        : period_(std::chrono::duration_cast<Nanos>(std::chrono::duration<double>(1.0 / freq_hz))),
          next_(Clock::now() + period_) {}

    /// Sleep until the next tick. A tick that is already late is not made
    /// up: the phase is re-anchored so ticks stay `period` apart.
    void wait() {
        auto now = Clock::now();
        if (now < next_) {
            std::this_thread::sleep_until(next_);
            overrun_ = false;
            last_latency_ = Clock::now() - next_;
            next_ += period_;
        } else {
            overrun_ = true;
            last_latency_ = now - next_;
            next_ = now + period_;
        }
    }

    bool overrun() const { return overrun_; }

    Nanos last_latency() const { return last_latency_; }

    Nanos period() const { return period_; }
};

// ── Statistics collection ────────────────────────────────────────────────────

struct PumpStats {
    uint64_t ticks = 0;
    uint64_t overruns = 0;
    uint64_t lines = 0;            // lines read from the transport
    uint64_t decoded = 0;          // lines stored
    uint64_t dropped = 0;          // lines rejected by the decoder
    uint64_t malformed_fields = 0; // fields skipped inside accepted lines
    uint64_t registrations = 0;
    int64_t max_line_ns = 0;
    int64_t total_line_ns = 0;

    void record_tick(bool overrun) {
        ++ticks;
        if (overrun)
            ++overruns;
    }

    void record_line(std::chrono::nanoseconds elapsed) {
        ++decoded;
        auto ns = elapsed.count();
        if (ns > max_line_ns)
            max_line_ns = ns;
        total_line_ns += ns;
    }

    int64_t avg_line_ns() const {
        return decoded > 0 ? total_line_ns / static_cast<int64_t>(decoded) : 0;
    }
};

// ── SignalRegistry ──────────────────────────────────────────────────────────

/// Ordered set of signal names seen on the stream.
///
/// Each name gets a slot index on first sight; the index never changes for
/// the lifetime of the registry. Single writer: only the stream pump
/// registers names. Not synchronized; callers serialize access.
class SignalRegistry {
    std::vector<std::string> names_;
    std::vector<uint8_t> included_;
    std::map<std::string, size_t, std::less<>> index_;

  public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    struct Registration {
        size_t index;
        bool is_new;
    };

    /// Return the slot for `name`, allocating the next one if unseen.
    /// New signals start included.
    Registration register_if_new(std::string_view name) {
        auto it = index_.find(name);
        if (it != index_.end())
            return {it->second, false};
        size_t idx = names_.size();
        names_.emplace_back(name);
        included_.push_back(1);
        index_.emplace(std::string(name), idx);
        return {idx, true};
    }

    /// Slot of `name`, or npos if never registered.
    size_t index_of(std::string_view name) const {
        auto it = index_.find(name);
        return it != index_.end() ? it->second : npos;
    }

    bool contains(std::string_view name) const { return index_of(name) != npos; }

    std::vector<std::string> names() const { return names_; }

    const std::string &name(size_t index) const { return names_.at(index); }

    size_t size() const { return names_.size(); }

    bool is_included(std::string_view name) const {
        size_t idx = index_of(name);
        return idx != npos && included_[idx] != 0;
    }

    bool is_included(size_t index) const {
        return index < included_.size() && included_[index] != 0;
    }

    /// Returns false if `name` is not registered.
    bool set_included(std::string_view name, bool included) {
        size_t idx = index_of(name);
        if (idx == npos)
            return false;
        included_[idx] = included ? 1 : 0;
        return true;
    }

    /// Forget every signal. Ends the session; indices restart at 0.
    void clear() {
        names_.clear();
        included_.clear();
        index_.clear();
    }
};

// ── SampleStore ─────────────────────────────────────────────────────────────

/// Index-aligned timestamp/value pair of one signal, in arrival order.
struct Series {
    std::vector<double> timestamps;
    std::vector<double> values;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    void clear() {
        timestamps.clear();
        values.clear();
    }
};

/// Append-only per-signal series plus the shared time index.
///
/// The time index holds one entry per stored line. Each sample also records
/// the line it arrived on, so a window expressed as a position in the time
/// index slices every signal at the same boundary even when signals report
/// on different lines. Nothing is ever evicted.
///
/// Not synchronized; the stream pump guards it together with the registry.
class SampleStore {
    struct Slot {
        std::vector<double> timestamps;
        std::vector<double> values;
        std::vector<size_t> lines; // time-index position of each sample
    };

    const SignalRegistry &registry_;
    std::vector<double> time_index_;
    std::vector<Slot> slots_;
    bool monotonic_ = true;
    uint64_t clock_regressions_ = 0;

    size_t slot_for(std::string_view name) const {
        size_t idx = registry_.index_of(name);
        if (idx == SignalRegistry::npos)
            throw StoreError(StoreErrc::NotFound, name);
        return idx;
    }

    Slot &ensure_slot(size_t idx) {
        if (idx >= slots_.size())
            slots_.resize(idx + 1);
        return slots_[idx];
    }

    size_t push_time(double timestamp) {
        if (!time_index_.empty() && !(timestamp >= time_index_.back())) {
            monotonic_ = false;
            ++clock_regressions_;
        } else if (std::isnan(timestamp)) {
            monotonic_ = false;
        }
        time_index_.push_back(timestamp);
        return time_index_.size() - 1;
    }

    void push_sample(size_t idx, size_t line, double timestamp, double value) {
        Slot &s = ensure_slot(idx);
        s.timestamps.push_back(timestamp);
        s.values.push_back(value);
        s.lines.push_back(line);
    }

  public:
    explicit SampleStore(const SignalRegistry &registry) : registry_(registry) {}

    /// Store a single sample as its own line: `timestamp` is appended to the
    /// time index and the sample to the named series.
    /// Throws StoreError if `name` is not registered.
    void append(std::string_view name, double timestamp, double value) {
        size_t idx = slot_for(name);
        size_t line = push_time(timestamp);
        push_sample(idx, line, timestamp, value);
    }

    /// Store every sample of a decoded line under one time-index entry.
    /// All names are resolved before anything is written, so a throw leaves
    /// the store unchanged. Returns the line's position in the time index.
    size_t append_line(const DecodedLine &line) {
        std::vector<size_t> slots;
        slots.reserve(line.samples.size());
        for (const auto &[name, value] : line.samples)
            slots.push_back(slot_for(name));

        size_t pos = push_time(line.timestamp);
        for (size_t i = 0; i < slots.size(); ++i)
            push_sample(slots[i], pos, line.timestamp, line.samples[i].second);
        return pos;
    }

    /// Smallest index i with time_index[i] >= max(0, latest - window_size),
    /// or 0 when there is none.
    ///
    /// Binary search while the index is non-decreasing. After a clock
    /// regression the index is no longer sorted and a linear scan computes
    /// the same definition; stale samples may then fall inside the window.
    size_t window_start(double window_size) const {
        if (time_index_.empty())
            return 0;
        double threshold = std::max(0.0, time_index_.back() - window_size);
        if (monotonic_) {
            auto it = std::lower_bound(time_index_.begin(), time_index_.end(), threshold);
            size_t i = static_cast<size_t>(it - time_index_.begin());
            return i < time_index_.size() ? i : 0;
        }
        for (size_t i = 0; i < time_index_.size(); ++i) {
            if (time_index_[i] >= threshold)
                return i;
        }
        return 0;
    }

    /// Full series of a registered signal. Empty if it has no samples yet.
    /// Throws StoreError if `name` is not registered.
    Series series(std::string_view name) const {
        size_t idx = slot_for(name);
        Series out;
        if (idx < slots_.size()) {
            out.timestamps = slots_[idx].timestamps;
            out.values = slots_[idx].values;
        }
        return out;
    }

    /// Copy the samples of slot `index` that arrived on line `start_line` or
    /// later into `out`, reusing its allocations. Returns the sample count.
    size_t copy_since(size_t index, size_t start_line, Series &out) const {
        out.clear();
        if (index >= slots_.size())
            return 0;
        const Slot &s = slots_[index];
        auto it = std::lower_bound(s.lines.begin(), s.lines.end(), start_line);
        size_t first = static_cast<size_t>(it - s.lines.begin());
        out.timestamps.assign(s.timestamps.begin() + first, s.timestamps.end());
        out.values.assign(s.values.begin() + first, s.values.end());
        return out.size();
    }

    size_t sample_count(size_t index) const {
        return index < slots_.size() ? slots_[index].values.size() : 0;
    }

    const std::vector<double> &time_index() const { return time_index_; }

    size_t line_count() const { return time_index_.size(); }

    /// Timestamp of the most recent line (0 when empty).
    double latest_time() const { return time_index_.empty() ? 0.0 : time_index_.back(); }

    bool monotonic() const { return monotonic_; }

    uint64_t clock_regressions() const { return clock_regressions_; }

    void clear() {
        time_index_.clear();
        slots_.clear();
        monotonic_ = true;
        clock_regressions_ = 0;
    }
};

} // namespace kvs
