//
// test_pump.cpp — End-to-end tests for StreamPump over a local socket pair
//
// The device side of the socket pair plays the serial device: tests write
// record lines into it and read outbound commands back from it.
//

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include <kvs_pump.h>

#define TEST(name)                                                                                 \
    static void test_##name();                                                                     \
    static struct TestRunner_##name {                                                              \
        TestRunner_##name() {                                                                      \
            printf("Running test: %s\n", #name);                                                   \
            test_##name();                                                                         \
            printf("  PASS: %s\n", #name);                                                         \
        }                                                                                          \
    } runner_##name;                                                                               \
    static void test_##name()

#define ASSERT_EQ(actual, expected)                                                                \
    do {                                                                                           \
        auto _a = (actual);                                                                        \
        auto _e = (expected);                                                                      \
        if (_a != _e) {                                                                            \
            fprintf(stderr, "FAIL: %s:%d: expected %f, got %f\n", __FILE__, __LINE__, (double)_e,  \
                    (double)_a);                                                                   \
            exit(1);                                                                               \
        }                                                                                          \
    } while (0)

#define ASSERT_EQ_STR(actual, expected)                                                            \
    do {                                                                                           \
        std::string _a = (actual);                                                                 \
        std::string _e = (expected);                                                               \
        if (_a != _e) {                                                                            \
            fprintf(stderr, "FAIL: %s:%d: expected '%s', got '%s'\n", __FILE__, __LINE__,          \
                    _e.c_str(), _a.c_str());                                                       \
            exit(1);                                                                               \
        }                                                                                          \
    } while (0)

#define ASSERT_TRUE(cond)                                                                          \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond);                       \
            exit(1);                                                                               \
        }                                                                                          \
    } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

using namespace kvs;

static constexpr double kFastTick = 1000.0;

// ── Helpers ─────────────────────────────────────────────────────────────────

struct Link {
    int device = -1; // test side
    FdLineTransport host;

    Link() {
        int sv[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, sv) != 0) {
            fprintf(stderr, "FAIL: socketpair: %s\n", strerror(errno));
            exit(1);
        }
        device = sv[1];
        host.attach(sv[0], true);
    }
    ~Link() { hang_up(); }

    void send(const std::string &s) const {
        size_t off = 0;
        while (off < s.size()) {
            ssize_t n = ::write(device, s.data() + off, s.size() - off);
            if (n <= 0) {
                fprintf(stderr, "FAIL: write: %s\n", strerror(errno));
                exit(1);
            }
            off += static_cast<size_t>(n);
        }
    }
    void hang_up() {
        if (device >= 0)
            ::close(device);
        device = -1;
    }
};

static bool wait_until(const std::function<bool()> &pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

struct RecordingSink : PersistenceSink {
    std::mutex mtx;
    std::vector<std::vector<std::string>> headers;
    std::vector<std::vector<double>> rows;
    std::atomic<int> row_count{0};

    void on_schema_changed(const std::vector<std::string> &h) override {
        std::lock_guard<std::mutex> lock(mtx);
        headers.push_back(h);
    }
    void on_line(std::span<const double> values) override {
        std::lock_guard<std::mutex> lock(mtx);
        rows.emplace_back(values.begin(), values.end());
        row_count.fetch_add(1);
    }
};

static Series series_of(const StreamPump &pump, const char *name) {
    Series s;
    pump.inspect([&](const SignalRegistry &, const SampleStore &store) { s = store.series(name); });
    return s;
}

// ── End to end ──────────────────────────────────────────────────────────────

TEST(pump_example_stream) {
    Link link;
    StreamPump pump(kFastTick);
    RecordingSink sink;
    pump.set_sink(&sink);
    pump.set_window_size(10.0);

    std::mutex ev_mtx;
    std::vector<LineEvent> events;
    std::vector<size_t> spans;
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &ev) {
        std::lock_guard<std::mutex> lock(ev_mtx);
        events.push_back(ev);
        spans.push_back(ev.time_index.size());
    }));
    ASSERT_TRUE(pump.state() == PumpState::Running);

    link.send("Time:0,A:1\nTime:1,A:2,B:5\nTime:2,B:6\n");
    ASSERT_TRUE(wait_until([&] { return sink.row_count.load() == 3; }));
    pump.stop();
    ASSERT_TRUE(pump.state() == PumpState::Idle);

    Series a = series_of(pump, "A");
    ASSERT_EQ(a.size(), 2u);
    ASSERT_EQ(a.timestamps[0], 0.0);
    ASSERT_EQ(a.values[0], 1.0);
    ASSERT_EQ(a.timestamps[1], 1.0);
    ASSERT_EQ(a.values[1], 2.0);
    Series b = series_of(pump, "B");
    ASSERT_EQ(b.size(), 2u);
    ASSERT_EQ(b.timestamps[0], 1.0);
    ASSERT_EQ(b.values[0], 5.0);
    ASSERT_EQ(b.timestamps[1], 2.0);
    ASSERT_EQ(b.values[1], 6.0);

    // Header grows in order of first appearance
    ASSERT_EQ(sink.headers.size(), 2u);
    ASSERT_EQ(sink.headers[0].size(), 2u);
    ASSERT_EQ_STR(sink.headers[0][1], "A");
    ASSERT_EQ(sink.headers[1].size(), 3u);
    ASSERT_EQ_STR(sink.headers[1][0], "Time");
    ASSERT_EQ_STR(sink.headers[1][1], "A");
    ASSERT_EQ_STR(sink.headers[1][2], "B");

    // Rows follow the header current at the time of the line
    ASSERT_EQ(sink.rows[0].size(), 2u);
    ASSERT_EQ(sink.rows[1].size(), 3u);
    ASSERT_EQ(sink.rows[1][2], 5.0);
    ASSERT_EQ(sink.rows[2][0], 2.0);
    ASSERT_TRUE(std::isnan(sink.rows[2][1]));
    ASSERT_EQ(sink.rows[2][2], 6.0);

    ASSERT_EQ(events.size(), 3u);
    for (size_t i = 0; i < events.size(); ++i) {
        ASSERT_EQ(events[i].line_index, i);
        ASSERT_EQ(spans[i], i + 1);
        ASSERT_EQ(events[i].window_start, 0u);
    }

    PumpStats st = pump.stats();
    ASSERT_EQ(st.lines, 3u);
    ASSERT_EQ(st.decoded, 3u);
    ASSERT_EQ(st.dropped, 0u);
    ASSERT_EQ(st.registrations, 2u);
}

TEST(pump_registration_announced_before_samples) {
    Link link;
    StreamPump pump(kFastTick);
    std::atomic<int> announced{0};
    std::atomic<bool> saw_samples{false};
    pump.add_registration_handler([&](const std::string &name, size_t index) {
        pump.inspect([&](const SignalRegistry &reg, const SampleStore &store) {
            if (store.sample_count(index) != 0 || !reg.contains(name))
                saw_samples.store(true);
        });
        announced.fetch_add(1);
    });
    std::atomic<int> lines{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &) { lines.fetch_add(1); }));
    link.send("Time:0,X:1,Y:2\nTime:1,X:3,Z:4\n");
    ASSERT_TRUE(wait_until([&] { return lines.load() == 2; }));
    pump.stop();
    ASSERT_EQ(announced.load(), 3);
    ASSERT_FALSE(saw_samples.load());

    std::vector<std::string> names = pump.signal_names();
    ASSERT_EQ(names.size(), 3u);
    ASSERT_EQ_STR(names[2], "Z");
}

TEST(pump_missing_time_is_reported_not_fatal) {
    Link link;
    StreamPump pump(kFastTick);
    std::atomic<int> errors{0};
    std::mutex mtx;
    std::string bad_line;
    pump.set_error_handler([&](DecodeError err, std::string_view line) {
        std::lock_guard<std::mutex> lock(mtx);
        if (err == DecodeError::MissingTimestamp)
            errors.fetch_add(1);
        bad_line.assign(line);
    });
    std::atomic<int> lines{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &) { lines.fetch_add(1); }));
    link.send("A:1,B:2\nTime:1,A:2\n");
    ASSERT_TRUE(wait_until([&] { return lines.load() == 1; }));
    ASSERT_TRUE(pump.is_running());
    pump.stop();

    ASSERT_EQ(errors.load(), 1);
    ASSERT_EQ_STR(bad_line, "A:1,B:2");
    // Nothing from the dropped line was registered
    std::vector<std::string> names = pump.signal_names();
    ASSERT_EQ(names.size(), 1u);
    ASSERT_EQ(series_of(pump, "A").size(), 1u);
    PumpStats st = pump.stats();
    ASSERT_EQ(st.lines, 2u);
    ASSERT_EQ(st.dropped, 1u);
    ASSERT_EQ(st.decoded, 1u);
}

TEST(pump_garbage_field_skipped) {
    Link link;
    StreamPump pump(kFastTick);
    std::atomic<int> lines{0};
    double ts = -1.0;
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &ev) {
        ts = ev.timestamp;
        lines.fetch_add(1);
    }));
    link.send("Time:1,Garbage\n");
    ASSERT_TRUE(wait_until([&] { return lines.load() == 1; }));
    pump.stop();
    ASSERT_EQ(ts, 1.0);
    ASSERT_EQ(pump.signal_names().size(), 0u);
    PumpStats st = pump.stats();
    ASSERT_EQ(st.dropped, 0u);
    ASSERT_EQ(st.malformed_fields, 1u);
}

TEST(pump_window_start_follows_latest) {
    Link link;
    StreamPump pump(kFastTick);
    ASSERT_TRUE(pump.set_window_size(10.0) == ConfigError::None);
    std::atomic<int> lines{0};
    std::atomic<size_t> last_ws{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &ev) {
        last_ws.store(ev.window_start);
        lines.fetch_add(1);
    }));
    std::string burst;
    for (int t = 0; t <= 20; ++t)
        burst += "Time:" + std::to_string(t) + ",A:" + std::to_string(t * t) + "\n";
    link.send(burst);
    ASSERT_TRUE(wait_until([&] { return lines.load() == 21; }));
    pump.stop();
    ASSERT_EQ(last_ws.load(), 10u);
}

TEST(pump_rejects_invalid_window) {
    StreamPump pump(kFastTick);
    ASSERT_TRUE(pump.set_window_size(0.0) == ConfigError::InvalidWindowSize);
    ASSERT_TRUE(pump.set_window_size(-1.0) == ConfigError::InvalidWindowSize);
    ASSERT_TRUE(pump.set_window_size(NAN) == ConfigError::InvalidWindowSize);
    ASSERT_TRUE(pump.set_window_size(5.0) == ConfigError::None);
    ASSERT_TRUE(pump.set_window_size(-3.0) == ConfigError::InvalidWindowSize);
    ASSERT_EQ(pump.window_size(), 5.0);
}

// ── State machine ───────────────────────────────────────────────────────────

TEST(pump_one_line_per_tick) {
    Link link;
    StreamPump pump(20.0); // 50 ms
    std::atomic<int> lines{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &) { lines.fetch_add(1); }));
    link.send("Time:0,A:1\nTime:1,A:2\nTime:2,A:3\nTime:3,A:4\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    int seen = lines.load();
    ASSERT_TRUE(seen >= 1);
    ASSERT_TRUE(seen <= 3);
    pump.stop();
}

TEST(pump_stop_within_one_tick) {
    Link link;
    StreamPump pump(10.0); // 100 ms
    std::atomic<int> lines{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &) { lines.fetch_add(1); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    auto t0 = std::chrono::steady_clock::now();
    pump.stop();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - t0)
                  .count();
    ASSERT_TRUE(ms < 200);
    ASSERT_FALSE(pump.is_running());

    // No ticks after stop
    link.send("Time:5,A:1\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    ASSERT_EQ(lines.load(), 0);
    ASSERT_EQ(pump.signal_names().size(), 0u);
}

TEST(pump_start_guards) {
    Link link;
    StreamPump pump(kFastTick);
    ASSERT_TRUE(pump.start(link.host));
    ASSERT_FALSE(pump.start(link.host)); // already running
    ASSERT_FALSE(pump.clear());          // not while running
    pump.stop();

    FdLineTransport closed;
    ASSERT_FALSE(pump.start(closed));
    ASSERT_TRUE(pump.state() == PumpState::Idle);

    StreamPump bad_tick(0.0);
    ASSERT_FALSE(bad_tick.start(link.host));
}

TEST(pump_restart_keeps_session) {
    Link link;
    StreamPump pump(kFastTick);
    std::atomic<int> lines{0};
    auto count = [&](const LineEvent &) { lines.fetch_add(1); };
    ASSERT_TRUE(pump.start(link.host, count));
    link.send("Time:0,A:1\n");
    ASSERT_TRUE(wait_until([&] { return lines.load() == 1; }));
    pump.stop();

    ASSERT_TRUE(pump.start(link.host, count));
    link.send("Time:1,A:2\n");
    ASSERT_TRUE(wait_until([&] { return lines.load() == 2; }));
    pump.stop();
    ASSERT_EQ(series_of(pump, "A").size(), 2u);

    ASSERT_TRUE(pump.clear());
    ASSERT_EQ(pump.signal_names().size(), 0u);
    ASSERT_EQ(pump.stats().lines, 0u);
}

TEST(pump_returns_to_idle_on_hangup) {
    Link link;
    StreamPump pump(kFastTick);
    std::atomic<int> lines{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &) { lines.fetch_add(1); }));
    link.send("Time:0,A:1\nTime:1,A:2");
    link.hang_up();
    ASSERT_TRUE(wait_until([&] { return !pump.is_running(); }));
    // Final unterminated line still delivered before the loop ended
    ASSERT_EQ(lines.load(), 2);
    ASSERT_TRUE(pump.last_transport_status() == ReadStatus::Closed);
    pump.stop();
}

TEST(pump_late_sink_gets_current_header) {
    Link link;
    StreamPump pump(kFastTick);
    std::atomic<int> lines{0};
    ASSERT_TRUE(pump.start(link.host, [&](const LineEvent &) { lines.fetch_add(1); }));
    link.send("Time:0,A:1,B:2\n");
    ASSERT_TRUE(wait_until([&] { return lines.load() == 1; }));
    pump.stop();

    RecordingSink sink;
    pump.set_sink(&sink);
    ASSERT_EQ(sink.headers.size(), 1u);
    ASSERT_EQ(sink.headers[0].size(), 3u);
    ASSERT_EQ_STR(sink.headers[0][2], "B");
}

// ── Outbound ────────────────────────────────────────────────────────────────

TEST(pump_send_command) {
    Link link;
    StreamPump pump(kFastTick);
    ASSERT_FALSE(pump.send_command("gain", 5.0)); // no transport yet
    ASSERT_TRUE(pump.start(link.host));
    ASSERT_TRUE(pump.send_command("gain", 5.0));
    ASSERT_FALSE(pump.send_command("  ", 1.0));

    char buf[32] = {};
    ssize_t n = ::read(link.device, buf, sizeof(buf) - 1);
    ASSERT_TRUE(n > 0);
    ASSERT_EQ_STR(std::string(buf, static_cast<size_t>(n)), "gain:5\n");
    pump.stop();
}

int main() {
    printf("All pump tests passed.\n");
    return 0;
}
