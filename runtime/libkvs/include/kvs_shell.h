#pragma once

// kvs_shell.h — headless capture shell
//
// Opens a serial port (or stdin), runs a StreamPump over it for a fixed
// duration or until SIGINT, optionally logs every line to CSV and prints
// pump statistics on exit. Used by the kvslog executable; the GUI builds
// the same pipeline around its own event loop.

#include <kvs.h>
#include <kvs_csv.h>
#include <kvs_line.h>
#include <kvs_pump.h>
#include <kvs_serial.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace kvs {

static constexpr int kDefaultBaud = 9600;
static constexpr double kDefaultWindowSeconds = 10.0;

struct ShellOptions {
    std::string port; // "-" reads stdin
    int baud = kDefaultBaud;
    std::string csv_path;
    double tick_hz = kDefaultTickHz;
    double duration_seconds = std::numeric_limits<double>::infinity();
    double window_seconds = kDefaultWindowSeconds;
    bool stats = false;
    bool echo = false;
    bool help = false;
};

namespace detail {

/// Whole-string strtod; false on trailing garbage or empty input.
inline bool parse_double(const char *s, double *out) {
    if (s == nullptr || *s == '\0')
        return false;
    char *end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno == ERANGE)
        return false;
    *out = v;
    return *end == '\0';
}

/// `<sec>`, `<sec>s`, `<min>m` or `inf`.
inline bool parse_duration(const std::string &s, double *out) {
    if (s == "inf") {
        *out = std::numeric_limits<double>::infinity();
        return true;
    }
    if (s.empty())
        return false;
    char *end = nullptr;
    errno = 0;
    double base = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || errno == ERANGE || !(base >= 0.0))
        return false;
    std::string unit(end);
    if (unit.empty() || unit == "s") {
        *out = base;
        return true;
    }
    if (unit == "m") {
        *out = base * 60.0;
        return true;
    }
    return false;
}

inline std::atomic<bool> &shell_stop_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

} // namespace detail

inline void print_shell_usage(const char *argv0) {
    std::fprintf(stderr, "Usage: %s --port <device|-> [options]\n", argv0);
    std::fprintf(stderr, "\n");
    std::fprintf(stderr, "  --port <device>     Serial device (e.g. /dev/ttyUSB0); '-' reads stdin\n");
    std::fprintf(stderr, "  --baud <rate>       Baud rate (default: %d)\n", kDefaultBaud);
    std::fprintf(stderr, "  --csv <path>        Log every line to a CSV file\n");
    std::fprintf(stderr, "  --tick-hz <N>       Polling rate, one line per tick (default: %.0f)\n",
                 kDefaultTickHz);
    std::fprintf(stderr, "  --window <sec>      Time window for --echo (default: %.0f)\n",
                 kDefaultWindowSeconds);
    std::fprintf(stderr, "  --duration <d>      Run time: <sec>, <sec>s, <min>m or inf (default)\n");
    std::fprintf(stderr, "  --stats             Print pump statistics on exit\n");
    std::fprintf(stderr, "  --echo              Print each stored line and its window start\n");
    std::fprintf(stderr, "  -h, --help          Show this help message\n");
}

/// Parse shell options into `opt`. Returns 0 on success, 2 on a startup
/// error (already reported on stderr). `--help` sets opt.help.
inline int parse_shell_args(int argc, char *argv[], ShellOptions &opt) {
    for (int i = 1; i < argc; ++i) {
        std::string o(argv[i]);
        if (o == "-h" || o == "--help") {
            opt.help = true;
            continue;
        }
        if (o == "--stats") {
            opt.stats = true;
            continue;
        }
        if (o == "--echo") {
            opt.echo = true;
            continue;
        }
        if (o == "--port" || o == "--baud" || o == "--csv" || o == "--tick-hz" ||
            o == "--window" || o == "--duration") {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "startup error: %s requires a value\n", o.c_str());
                return 2;
            }
            const char *v = argv[++i];
            if (o == "--port") {
                opt.port = v;
            } else if (o == "--csv") {
                opt.csv_path = v;
            } else if (o == "--baud") {
                double b = 0.0;
                if (!detail::parse_double(v, &b) || b != std::floor(b) ||
                    !is_valid_baud(static_cast<int>(b))) {
                    std::fprintf(stderr, "startup error: unsupported baud rate '%s'\n", v);
                    return 2;
                }
                opt.baud = static_cast<int>(b);
            } else if (o == "--tick-hz") {
                if (!detail::parse_double(v, &opt.tick_hz) || !(opt.tick_hz > 0.0) ||
                    !std::isfinite(opt.tick_hz)) {
                    std::fprintf(stderr, "startup error: --tick-hz requires a positive number\n");
                    return 2;
                }
            } else if (o == "--window") {
                double w = 0.0;
                if (!detail::parse_double(v, &w) ||
                    validate_window_size(w) != ConfigError::None) {
                    std::fprintf(stderr, "startup error: --window '%s': %s\n", v,
                                 config_error_str(ConfigError::InvalidWindowSize));
                    return 2;
                }
                opt.window_seconds = w;
            } else {
                if (!detail::parse_duration(v, &opt.duration_seconds)) {
                    std::fprintf(stderr,
                                 "startup error: invalid --duration '%s' (use <sec>, <sec>s, "
                                 "<min>m, or inf)\n",
                                 v);
                    return 2;
                }
            }
            continue;
        }
        std::fprintf(stderr, "startup error: unknown option '%s'\n", argv[i]);
        return 2;
    }
    if (!opt.help && opt.port.empty()) {
        std::fprintf(stderr, "startup error: --port is required\n");
        return 2;
    }
    return 0;
}

inline void print_pump_stats(const PumpStats &s) {
    std::fprintf(stderr,
                 "[stats] pump: ticks=%lu, overruns=%lu, lines=%lu, decoded=%lu, dropped=%lu, "
                 "malformed_fields=%lu\n",
                 (unsigned long)s.ticks, (unsigned long)s.overruns, (unsigned long)s.lines,
                 (unsigned long)s.decoded, (unsigned long)s.dropped,
                 (unsigned long)s.malformed_fields);
    std::fprintf(stderr, "[stats] line: max_latency=%ldns, avg_latency=%ldns\n",
                 (long)s.max_line_ns, (long)s.avg_line_ns());
}

// ── Shell entry point ───────────────────────────────────────────────────────

/// Exit codes: 0 normal end (duration elapsed, SIGINT, or end of stream),
/// 1 transport read error, 2 startup error.
inline int shell_main(int argc, char *argv[]) {
    ShellOptions opt;
    int rc = parse_shell_args(argc, argv, opt);
    if (rc != 0)
        return rc;
    if (opt.help) {
        print_shell_usage(argv[0]);
        return 0;
    }

    // ── Transport ───────────────────────────────────────────────────────
    SerialPort serial;
    FdLineTransport stdin_transport;
    FdLineTransport *transport = nullptr;
    if (opt.port == "-") {
        if (!stdin_transport.attach(STDIN_FILENO, false)) {
            std::fprintf(stderr, "startup error: cannot read stdin: %s\n", std::strerror(errno));
            return 2;
        }
        transport = &stdin_transport;
    } else {
        if (!serial.open(opt.port.c_str(), opt.baud)) {
            std::fprintf(stderr, "startup error: failed to open '%s' at %d baud: %s\n",
                         opt.port.c_str(), opt.baud, serial.last_error_message().c_str());
            return 2;
        }
        transport = &serial;
    }

    // ── Sink ────────────────────────────────────────────────────────────
    CsvSink csv;
    if (!opt.csv_path.empty() && !csv.open(opt.csv_path.c_str())) {
        std::fprintf(stderr, "startup error: failed to open CSV output '%s': %s\n",
                     opt.csv_path.c_str(), std::strerror(errno));
        return 2;
    }

    // ── Pump ────────────────────────────────────────────────────────────
    StreamPump pump(opt.tick_hz);
    pump.set_window_size(opt.window_seconds);
    if (csv.is_open())
        pump.set_sink(&csv);
    pump.add_registration_handler([](const std::string &name, size_t index) {
        std::fprintf(stderr, "kvslog: new signal '%s' (#%zu)\n", name.c_str(), index);
    });

    LineHandler on_line;
    if (opt.echo) {
        on_line = [](const LineEvent &ev) {
            std::printf("%zu\t%.15g\t%zu\n", ev.line_index, ev.timestamp, ev.window_start);
            std::fflush(stdout);
        };
    }

    std::atomic<bool> &stop = detail::shell_stop_flag();
    stop.store(false);
    std::signal(SIGINT, [](int) { detail::shell_stop_flag().store(true); });

    if (!pump.start(*transport, on_line)) {
        std::fprintf(stderr, "startup error: failed to start stream pump\n");
        return 2;
    }

    // ── Duration wait ───────────────────────────────────────────────────
    auto t0 = std::chrono::steady_clock::now();
    while (!stop.load(std::memory_order_acquire) && pump.is_running()) {
        double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        if (elapsed >= opt.duration_seconds)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    pump.stop();
    std::signal(SIGINT, SIG_DFL);

    ReadStatus end = pump.last_transport_status();
    int exit_code = 0;
    if (end == ReadStatus::Error) {
        std::fprintf(stderr, "kvslog: transport read error on '%s'\n", opt.port.c_str());
        exit_code = 1;
    } else if (end == ReadStatus::Closed) {
        std::fprintf(stderr, "kvslog: end of stream on '%s'\n", opt.port.c_str());
    }

    // ── Stats output ────────────────────────────────────────────────────
    if (opt.stats) {
        print_pump_stats(pump.stats());
        std::vector<std::string> names = pump.signal_names();
        std::fprintf(stderr, "[stats] signals: %zu", names.size());
        for (size_t i = 0; i < names.size(); ++i)
            std::fprintf(stderr, "%s%s", i == 0 ? " (" : ", ", names[i].c_str());
        std::fprintf(stderr, "%s\n", names.empty() ? "" : ")");
        std::fprintf(stderr, "[stats] transport: overflowed_lines=%lu\n",
                     (unsigned long)transport->overflow_count());
        if (csv.is_open())
            std::fprintf(stderr, "[stats] csv '%s': rows=%lu, write_errors=%lu\n",
                         csv.path().c_str(), (unsigned long)csv.rows(),
                         (unsigned long)csv.write_errors());
    }

    return exit_code;
}

} // namespace kvs
