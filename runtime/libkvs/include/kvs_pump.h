#pragma once
/// @file kvs_pump.h
/// @brief Stream pump: transport lines → decoder → registry/store → consumers
///
/// The pump owns the signal registry and the sample store for the lifetime
/// of a session and is their only writer. A background thread polls the
/// transport on a fixed tick and handles at most one line per tick.
/// Readers (render selector, stats) take the same mutex for a snapshot; it is
/// never held across transport or sink I/O.

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <functional>
#include <limits>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <kvs.h>
#include <kvs_csv.h>
#include <kvs_line.h>
#include <kvs_serial.h>

namespace kvs {

/// 10 ms polling period.
static constexpr double kDefaultTickHz = 100.0;

enum class PumpState { Idle, Running };

/// Passed to the line handler after each stored line. `time_index` aliases
/// the store and is only valid during the callback.
struct LineEvent {
    size_t line_index;
    double timestamp;
    size_t window_start;
    std::span<const double> time_index;
};

using LineHandler = std::function<void(const LineEvent &)>;
using DecodeErrorHandler = std::function<void(DecodeError, std::string_view line)>;
using RegistrationHandler = std::function<void(const std::string &name, size_t index)>;

inline void default_decode_error_handler(DecodeError err, std::string_view line) {
    std::fprintf(stderr, "kvs: dropped line (%s): %.*s\n", decode_error_str(err),
                 static_cast<int>(line.size()), line.data());
}

class StreamPump {
    mutable std::mutex mutex_;
    SignalRegistry registry_;
    SampleStore store_{registry_};
    PumpStats stats_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    double tick_hz_;
    std::atomic<double> window_size_{std::numeric_limits<double>::quiet_NaN()};
    std::atomic<ReadStatus> transport_status_{ReadStatus::Empty};

    // Set while Idle, read by the pump thread
    LineTransport *transport_ = nullptr;
    LineHandler line_handler_;
    DecodeErrorHandler error_handler_ = default_decode_error_handler;
    std::vector<RegistrationHandler> registration_handlers_;
    PersistenceSink *sink_ = nullptr;

    // Pump-thread only
    std::vector<std::string> headers_{std::string(kTimeKey)};
    std::vector<double> row_;

  public:
    explicit StreamPump(double tick_hz = kDefaultTickHz) : tick_hz_(tick_hz) {}

    ~StreamPump() { stop(); }

    // ── Configuration (while Idle) ──────────────────────────────────────

    /// A sink attached mid-session is sent the current header first.
    void set_sink(PersistenceSink *sink) {
        sink_ = sink;
        if (sink_ && headers_.size() > 1)
            sink_->on_schema_changed(headers_);
    }

    void set_error_handler(DecodeErrorHandler handler) {
        error_handler_ = handler ? std::move(handler) : default_decode_error_handler;
    }

    /// Called on the pump thread for every newly registered signal, before
    /// any of its samples is stored.
    void add_registration_handler(RegistrationHandler handler) {
        registration_handlers_.push_back(std::move(handler));
    }

    /// May be changed at any time. An invalid size is rejected and the
    /// previous one kept; until a valid size is set the window spans the
    /// whole history.
    ConfigError set_window_size(double window_size) {
        ConfigError err = validate_window_size(window_size);
        if (err == ConfigError::None)
            window_size_.store(window_size, std::memory_order_relaxed);
        return err;
    }

    double window_size() const { return window_size_.load(std::memory_order_relaxed); }

    double tick_hz() const { return tick_hz_; }

    // ── State machine ───────────────────────────────────────────────────

    /// Idle → Running: start polling `transport` on the pump thread.
    ///
    /// Preconditions: pump is Idle; `transport` is open and outlives the
    ///   Running state.
    /// Postconditions: on success the pump thread is running. Registry and
    ///   store keep the current session's data.
    /// Failure modes: returns false if already running, the transport is not
    ///   open, or the tick rate is not positive.
    bool start(LineTransport &transport, LineHandler handler = nullptr) {
        if (running_.load())
            return false;
        if (thread_.joinable())
            thread_.join(); // loop ended by itself (transport closed)
        if (!transport.is_open() || !(tick_hz_ > 0.0))
            return false;

        transport_ = &transport;
        line_handler_ = std::move(handler);
        transport_status_.store(ReadStatus::Empty);
        running_.store(true);
        thread_ = std::thread(&StreamPump::pump_loop, this);
        return true;
    }

    /// Running → Idle. No tick starts after this returns; the line being
    /// handled, if any, completes first.
    void stop() {
        running_.store(false);
        if (thread_.joinable())
            thread_.join();
    }

    PumpState state() const { return running_.load() ? PumpState::Running : PumpState::Idle; }

    bool is_running() const { return running_.load(); }

    /// Why the loop ended on its own: Closed or Error, Empty if it did not.
    ReadStatus last_transport_status() const { return transport_status_.load(); }

    /// Drop every signal and sample and start a new session. Idle only;
    /// returns false while running.
    bool clear() {
        if (running_.load())
            return false;
        std::lock_guard<std::mutex> lock(mutex_);
        store_.clear();
        registry_.clear();
        stats_ = PumpStats{};
        headers_.assign(1, std::string(kTimeKey));
        return true;
    }

    // ── Outbound ────────────────────────────────────────────────────────

    /// Write "name:value" to the device. Call from the controlling thread.
    bool send_command(std::string_view name, double value) {
        if (!transport_ || !transport_->is_open() || trim(name).empty())
            return false;
        return transport_->write_line(encode_command(name, value));
    }

    // ── Readers ─────────────────────────────────────────────────────────

    /// Run `fn(registry, store)` under the pump lock. Keep it short: the
    /// pump thread waits for it.
    template <typename Fn> void inspect(Fn &&fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(registry_, store_);
    }

    bool set_included(std::string_view name, bool included) {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.set_included(name, included);
    }

    std::vector<std::string> signal_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.names();
    }

    PumpStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    // Non-copyable
    StreamPump(const StreamPump &) = delete;
    StreamPump &operator=(const StreamPump &) = delete;

  private:
    size_t current_window_start() const {
        double w = window_size_.load(std::memory_order_relaxed);
        if (validate_window_size(w) != ConfigError::None)
            return 0;
        return store_.window_start(w);
    }

    /// Decode and store one line. Decode failures are reported and the line
    /// is dropped before anything is registered or stored.
    void process_line(const std::string &text) {
        auto t0 = std::chrono::steady_clock::now();

        DecodeResult r = decode_line(text);
        if (!r.ok()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.lines++;
                stats_.dropped++;
            }
            error_handler_(r.error, text);
            return;
        }
        const DecodedLine &line = r.line;

        // 1. Registration, announced before the first sample is stored
        std::vector<std::pair<std::string, size_t>> fresh;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &[name, value] : line.samples) {
                auto reg = registry_.register_if_new(name);
                if (reg.is_new)
                    fresh.emplace_back(name, reg.index);
            }
        }
        for (const auto &[name, index] : fresh) {
            headers_.push_back(name);
            for (const auto &handler : registration_handlers_)
                handler(name, index);
        }
        if (!fresh.empty() && sink_)
            sink_->on_schema_changed(headers_);

        // 2-3. Store, then recompute the window
        size_t pos = 0;
        size_t ws = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pos = store_.append_line(line);
            ws = current_window_start();
            stats_.lines++;
            stats_.malformed_fields += line.malformed_fields;
            stats_.registrations += fresh.size();
            stats_.record_line(std::chrono::steady_clock::now() - t0);
        }

        // 4. Redraw hook. This thread is the only writer, so the time index
        // can be read here without the lock.
        if (line_handler_) {
            const auto &ti = store_.time_index();
            line_handler_(LineEvent{pos, line.timestamp, ws,
                                    std::span<const double>(ti.data(), pos + 1)});
        }

        // 5. Persistence row in header order
        if (sink_) {
            row_.assign(headers_.size(), std::numeric_limits<double>::quiet_NaN());
            row_[0] = line.timestamp;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &[name, value] : line.samples)
                    row_[1 + registry_.index_of(name)] = value;
            }
            sink_->on_line(row_);
        }
    }

    void pump_loop() {
        Timer timer(tick_hz_);
        std::string text;

        while (running_.load(std::memory_order_acquire)) {
            timer.wait();
            if (!running_.load(std::memory_order_acquire))
                break;

            bool available = transport_->is_line_available();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.record_tick(timer.overrun());
            }

            if (!available) {
                if (transport_->at_end()) {
                    ReadStatus st = transport_->read_line(text);
                    transport_status_.store(st == ReadStatus::Error ? ReadStatus::Error
                                                              : ReadStatus::Closed);
                    break;
                }
                continue;
            }

            ReadStatus st = transport_->read_line(text);
            if (st == ReadStatus::Line)
                process_line(text);
        }
        running_.store(false, std::memory_order_release);
    }
};

} // namespace kvs
