#pragma once
/// @file kvs_select.h
/// @brief Render selector: inclusion flags and the windowed view for plotting
///
/// The selector is the read side of a StreamPump. It is called from the
/// render tick (UI thread), takes one snapshot of the included signals under
/// the pump lock, and hands it to a RenderSurface. It never mutates the
/// store; the only state it writes is the per-signal inclusion flag.

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <kvs.h>
#include <kvs_pump.h>

namespace kvs {

/// One included signal, restricted to the current window.
struct SeriesSnapshot {
    std::string name;
    size_t index = 0; // registration order; stable colour/legend slot
    Series data;
};

/// Everything a surface needs to draw one frame.
struct RenderFrame {
    std::vector<SeriesSnapshot> series; // registry order, included signals only
    size_t window_start = 0;            // position in the shared time index
    size_t line_count = 0;
    double x_min = 0.0; // time_index[window_start]
    double x_max = 0.0; // max(latest, window_size)

    void clear() {
        series.clear();
        window_start = 0;
        line_count = 0;
        x_min = 0.0;
        x_max = 0.0;
    }
};

/// Rendering collaborator.
class RenderSurface {
  public:
    virtual ~RenderSurface() = default;
    virtual void redraw(const RenderFrame &frame) = 0;
};

class RenderSelector {
    StreamPump &pump_;

    std::mutex pending_mutex_;
    std::vector<std::string> pending_; // registered since the last take

  public:
    /// Subscribes to registrations of `pump`; construct while the pump is Idle.
    explicit RenderSelector(StreamPump &pump) : pump_(pump) {
        pump_.add_registration_handler([this](const std::string &name, size_t) {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.push_back(name);
        });
    }

    /// Returns false if `name` has not been registered.
    bool toggle(std::string_view name, bool included) {
        return pump_.set_included(name, included);
    }

    bool is_included(std::string_view name) const {
        bool r = false;
        pump_.inspect([&](const SignalRegistry &reg, const SampleStore &) {
            r = reg.is_included(name);
        });
        return r;
    }

    /// Signals registered since the previous call, in registration order.
    /// The GUI creates one checkbox per returned name.
    std::vector<std::string> take_new_signals() {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        std::vector<std::string> out;
        out.swap(pending_);
        return out;
    }

    /// Snapshot the windowed part of every included signal.
    ///
    /// Preconditions: none; may run concurrently with the pump thread.
    /// Postconditions: on success `frame` holds, in registry order, the
    ///   samples of each included signal that arrived at or after
    ///   store.window_start(window_size). Existing allocations in `frame`
    ///   are reused.
    /// Failure modes: InvalidWindowSize when `window_size` is not a finite
    ///   positive number; `frame` is left untouched so the previous frame
    ///   can be shown again.
    ConfigError visible_series(double window_size, RenderFrame &frame) const {
        ConfigError err = validate_window_size(window_size);
        if (err != ConfigError::None)
            return err;

        pump_.inspect([&](const SignalRegistry &reg, const SampleStore &store) {
            size_t ws = store.window_start(window_size);
            frame.window_start = ws;
            frame.line_count = store.line_count();

            const auto &ti = store.time_index();
            frame.x_min = ti.empty() ? 0.0 : ti[ws];
            frame.x_max = std::max(store.latest_time(), window_size);

            size_t n = 0;
            for (size_t i = 0; i < reg.size(); ++i) {
                if (!reg.is_included(i))
                    continue;
                if (n == frame.series.size())
                    frame.series.emplace_back();
                SeriesSnapshot &s = frame.series[n++];
                s.name = reg.name(i);
                s.index = i;
                store.copy_since(i, ws, s.data);
            }
            frame.series.resize(n);
        });
        return ConfigError::None;
    }

    /// One render tick: snapshot, then redraw. On an invalid window nothing
    /// is drawn and the error is returned.
    ConfigError render(double window_size, RenderFrame &frame, RenderSurface &surface) const {
        ConfigError err = visible_series(window_size, frame);
        if (err == ConfigError::None)
            surface.redraw(frame);
        return err;
    }
};

} // namespace kvs
