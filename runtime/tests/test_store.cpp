//
// test_store.cpp — Unit tests for SampleStore (kvs.h): series, time index,
// window boundary, and the clock-regression fallback
//

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

#include <kvs.h>

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

static DecodedLine make_line(double t, std::vector<std::pair<std::string, double>> samples) {
    DecodedLine line;
    line.timestamp = t;
    line.samples = std::move(samples);
    return line;
}

// Register every name of `line` and store it
static size_t feed(SignalRegistry &reg, SampleStore &store, const DecodedLine &line) {
    for (const auto &s : line.samples)
        reg.register_if_new(s.first);
    return store.append_line(line);
}

// ── Series ──────────────────────────────────────────────────────────────────

TEST(append_line_one_time_entry_per_line) {
    SignalRegistry reg;
    SampleStore store(reg);
    ASSERT_EQ(feed(reg, store, make_line(0.0, {{"A", 1}, {"B", 2}})), 0u);
    ASSERT_EQ(feed(reg, store, make_line(0.5, {{"A", 3}, {"B", 4}})), 1u);
    ASSERT_EQ(store.line_count(), 2u);
    ASSERT_EQ(store.time_index()[1], 0.5);
    ASSERT_EQ(store.latest_time(), 0.5);
    ASSERT_EQ(store.sample_count(0), 2u);
    ASSERT_EQ(store.sample_count(1), 2u);
}

TEST(series_index_aligned_in_arrival_order) {
    SignalRegistry reg;
    SampleStore store(reg);
    feed(reg, store, make_line(0, {{"A", 1}}));
    feed(reg, store, make_line(1, {{"A", 2}, {"B", 5}}));
    feed(reg, store, make_line(2, {{"B", 6}}));

    Series a = store.series("A");
    ASSERT_EQ(a.size(), 2u);
    ASSERT_EQ(a.timestamps.size(), a.values.size());
    ASSERT_EQ(a.timestamps[0], 0.0);
    ASSERT_EQ(a.values[0], 1.0);
    ASSERT_EQ(a.timestamps[1], 1.0);
    ASSERT_EQ(a.values[1], 2.0);

    Series b = store.series("B");
    ASSERT_EQ(b.size(), 2u);
    ASSERT_EQ(b.timestamps[0], 1.0);
    ASSERT_EQ(b.values[0], 5.0);
    ASSERT_EQ(b.timestamps[1], 2.0);
    ASSERT_EQ(b.values[1], 6.0);
}

TEST(series_of_registered_signal_without_samples) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("idle");
    Series s = store.series("idle");
    ASSERT_TRUE(s.empty());
    ASSERT_TRUE(s.timestamps.empty());
}

TEST(single_sample_append) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    store.append("A", 1.0, 10.0);
    store.append("A", 2.0, 20.0);
    ASSERT_EQ(store.line_count(), 2u);
    Series a = store.series("A");
    ASSERT_EQ(a.size(), 2u);
    ASSERT_EQ(a.values[1], 20.0);
}

TEST(nan_values_stored_as_is) {
    SignalRegistry reg;
    SampleStore store(reg);
    double nan = std::numeric_limits<double>::quiet_NaN();
    feed(reg, store, make_line(1, {{"A", nan}}));
    Series a = store.series("A");
    ASSERT_EQ(a.size(), 1u);
    ASSERT_TRUE(std::isnan(a.values[0]));
}

// ── NotFound ────────────────────────────────────────────────────────────────

TEST(series_unregistered_throws) {
    SignalRegistry reg;
    SampleStore store(reg);
    bool thrown = false;
    try {
        store.series("ghost");
    } catch (const StoreError &e) {
        thrown = true;
        ASSERT_TRUE(e.code() == StoreErrc::NotFound);
    }
    ASSERT_TRUE(thrown);
}

TEST(append_unregistered_throws_and_leaves_store_unchanged) {
    SignalRegistry reg;
    SampleStore store(reg);
    feed(reg, store, make_line(0, {{"A", 1}}));

    bool thrown = false;
    try {
        store.append_line(make_line(1, {{"A", 2}, {"ghost", 3}}));
    } catch (const StoreError &) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(store.line_count(), 1u);
    ASSERT_EQ(store.sample_count(0), 1u);

    thrown = false;
    try {
        store.append("ghost", 1, 1);
    } catch (const StoreError &) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(store.line_count(), 1u);
}

// ── window_start ────────────────────────────────────────────────────────────

TEST(window_start_first_timestamp_in_window) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    for (int t = 0; t <= 20; ++t)
        store.append("A", t, t * 2.0);
    ASSERT_EQ(store.window_start(10.0), 10u);
    ASSERT_EQ(store.time_index()[store.window_start(10.0)], 10.0);
    ASSERT_EQ(store.window_start(0.5), 20u);
}

TEST(window_start_between_timestamps) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    store.append("A", 0.0, 0);
    store.append("A", 0.5, 0);
    store.append("A", 1.7, 0);
    store.append("A", 3.2, 0);
    // threshold 1.2 → first timestamp >= 1.2 is 1.7
    ASSERT_EQ(store.window_start(2.0), 2u);
}

TEST(window_start_larger_than_history) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    store.append("A", 3.0, 0);
    store.append("A", 4.0, 0);
    // threshold clamps to 0
    ASSERT_EQ(store.window_start(100.0), 0u);
}

TEST(window_start_empty_store) {
    SignalRegistry reg;
    SampleStore store(reg);
    ASSERT_EQ(store.window_start(10.0), 0u);
    ASSERT_EQ(store.latest_time(), 0.0);
}

TEST(window_start_equal_timestamps) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    store.append("A", 1.0, 0);
    store.append("A", 5.0, 0);
    store.append("A", 5.0, 0);
    store.append("A", 5.0, 0);
    ASSERT_TRUE(store.monotonic());
    ASSERT_EQ(store.window_start(1.0), 1u);
}

// ── Clock regressions ───────────────────────────────────────────────────────

TEST(regression_switches_to_linear_scan) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    const double ts[] = {0, 5, 10, 2, 3};
    for (double t : ts)
        store.append("A", t, t);
    ASSERT_FALSE(store.monotonic());
    ASSERT_EQ(store.clock_regressions(), 1u);
    ASSERT_EQ(store.line_count(), 5u);
    // latest 3, window 1 → threshold 2; first entry >= 2 in arrival order is 5
    ASSERT_EQ(store.window_start(1.0), 1u);
    // threshold clamps to 0 → whole history
    ASSERT_EQ(store.window_start(4.0), 0u);
}

TEST(regression_after_device_reset) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    for (int t = 100; t < 110; ++t)
        store.append("A", t, 0);
    store.append("A", 0.0, 0);
    store.append("A", 1.0, 0);
    // Stale samples stay inside the window; the call must not fault
    size_t ws = store.window_start(0.5);
    ASSERT_TRUE(ws < store.line_count());
    ASSERT_EQ(store.time_index()[ws], 100.0);
}

TEST(nan_timestamp_is_not_monotonic) {
    SignalRegistry reg;
    SampleStore store(reg);
    reg.register_if_new("A");
    store.append("A", 1.0, 0);
    store.append("A", std::numeric_limits<double>::quiet_NaN(), 0);
    store.append("A", 3.0, 0);
    ASSERT_FALSE(store.monotonic());
    ASSERT_EQ(store.window_start(1.5), 2u);
}

// ── copy_since ──────────────────────────────────────────────────────────────

TEST(copy_since_uses_shared_line_boundary) {
    SignalRegistry reg;
    SampleStore store(reg);
    feed(reg, store, make_line(0, {{"A", 1}}));
    feed(reg, store, make_line(1, {{"A", 2}, {"B", 5}}));
    feed(reg, store, make_line(2, {{"B", 6}}));

    Series out;
    ASSERT_EQ(store.copy_since(0, 1, out), 1u);
    ASSERT_EQ(out.timestamps[0], 1.0);
    ASSERT_EQ(out.values[0], 2.0);

    ASSERT_EQ(store.copy_since(1, 1, out), 2u);
    ASSERT_EQ(out.values[0], 5.0);
    ASSERT_EQ(out.values[1], 6.0);

    ASSERT_EQ(store.copy_since(0, 2, out), 0u);
    ASSERT_TRUE(out.empty());

    ASSERT_EQ(store.copy_since(7, 0, out), 0u);
}

TEST(clear_resets_everything) {
    SignalRegistry reg;
    SampleStore store(reg);
    feed(reg, store, make_line(5, {{"A", 1}}));
    feed(reg, store, make_line(1, {{"A", 1}}));
    store.clear();
    ASSERT_EQ(store.line_count(), 0u);
    ASSERT_TRUE(store.monotonic());
    ASSERT_EQ(store.clock_regressions(), 0u);
    ASSERT_EQ(store.sample_count(0), 0u);
}

int main() {
    printf("All store tests passed.\n");
    return 0;
}
