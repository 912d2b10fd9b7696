#pragma once
/// @file cli.h
/// @brief CLI argument parsing for kvscope (inline, no .cpp needed)

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <kvs.h>
#include <kvs_pump.h>
#include <kvs_serial.h>

namespace kvscope {

struct CliArgs {
    char port[256] = {};
    bool has_port = false;
    int baud = 9600;
    double window_seconds = 10.0;
    char csv_path[512] = {};
    bool has_csv = false;
    double tick_hz = kvs::kDefaultTickHz;
    bool vsync = false;
    bool help = false;
    bool error = false;
};

inline void print_usage(const char *argv0) {
    fprintf(stderr, "Usage: %s [--port <device>] [options]\n", argv0);
    fprintf(stderr, "       %s [-p <device>] [-b <baud>] [-w <sec>] [-o <file.csv>]\n", argv0);
    fprintf(stderr, "\n");
    fprintf(stderr, "  -p, --port <device>     Serial device; start streaming immediately\n");
    fprintf(stderr, "  -b, --baud <rate>       Baud rate (default: 9600)\n");
    fprintf(stderr, "  -w, --window <sec>      Time window size (default: 10)\n");
    fprintf(stderr, "  -o, --csv <path>        Log every record to a CSV file\n");
    fprintf(stderr, "      --tick-hz <N>       Polling rate (default: 100)\n");
    fprintf(stderr, "      --vsync             Enable vsync (default: off)\n");
    fprintf(stderr, "  -h, --help              Show this help message\n");
    fprintf(stderr, "\nIf no port is given, starts idle with the port/baud fields in the GUI.\n");
}

/// Strict numeric parse: the whole argument must be a number.
inline bool parse_number_arg(const char *s, double *out) {
    if (s == nullptr || *s == '\0')
        return false;
    char *end = nullptr;
    double v = strtod(s, &end);
    if (end == s || *end != '\0')
        return false;
    *out = v;
    return true;
}

inline CliArgs parse_args(int argc, char **argv) {
    CliArgs args{};
    for (int i = 1; i < argc; i++) {
        const char *a = argv[i];
        if (strcmp(a, "--help") == 0 || strcmp(a, "-h") == 0) {
            args.help = true;
            continue;
        }
        if (strcmp(a, "--vsync") == 0) {
            args.vsync = true;
            continue;
        }
        bool takes_value = strcmp(a, "--port") == 0 || strcmp(a, "-p") == 0 ||
                           strcmp(a, "--baud") == 0 || strcmp(a, "-b") == 0 ||
                           strcmp(a, "--window") == 0 || strcmp(a, "-w") == 0 ||
                           strcmp(a, "--csv") == 0 || strcmp(a, "-o") == 0 ||
                           strcmp(a, "--tick-hz") == 0;
        if (!takes_value) {
            fprintf(stderr, "Error: unknown option '%s'\n", a);
            args.error = true;
            continue;
        }
        if (i + 1 >= argc) {
            fprintf(stderr, "Error: %s requires a value\n", a);
            args.error = true;
            continue;
        }
        const char *v = argv[++i];

        if (strcmp(a, "--port") == 0 || strcmp(a, "-p") == 0) {
            size_t len = strlen(v);
            if (len > 0 && len < sizeof(args.port)) {
                memcpy(args.port, v, len + 1);
                args.has_port = true;
            } else {
                fprintf(stderr, "Error: invalid port '%s'\n", v);
                args.error = true;
            }
        } else if (strcmp(a, "--baud") == 0 || strcmp(a, "-b") == 0) {
            double b = 0.0;
            if (parse_number_arg(v, &b) && b == std::floor(b) && b > 0 && b < 1e7 &&
                kvs::is_valid_baud(static_cast<int>(b))) {
                args.baud = static_cast<int>(b);
            } else {
                fprintf(stderr, "Error: unsupported baud rate '%s'\n", v);
                args.error = true;
            }
        } else if (strcmp(a, "--window") == 0 || strcmp(a, "-w") == 0) {
            double w = 0.0;
            if (parse_number_arg(v, &w) && kvs::validate_window_size(w) == kvs::ConfigError::None) {
                args.window_seconds = w;
            } else {
                fprintf(stderr, "Error: invalid window '%s' (must be > 0)\n", v);
                args.error = true;
            }
        } else if (strcmp(a, "--csv") == 0 || strcmp(a, "-o") == 0) {
            size_t len = strlen(v);
            if (len > 0 && len < sizeof(args.csv_path)) {
                memcpy(args.csv_path, v, len + 1);
                args.has_csv = true;
            } else {
                fprintf(stderr, "Error: invalid CSV path '%s'\n", v);
                args.error = true;
            }
        } else {
            double hz = 0.0;
            if (parse_number_arg(v, &hz) && hz > 0.0 && std::isfinite(hz)) {
                args.tick_hz = hz;
            } else {
                fprintf(stderr, "Error: invalid tick rate '%s'\n", v);
                args.error = true;
            }
        }
    }
    return args;
}

} // namespace kvscope
