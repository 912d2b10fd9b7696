// mock_device.cpp — pseudo-terminal device emitting the example record stream
//
// Opens a pty pair, prints the slave path, and writes
//   Time:<s>,DataA:<v>,DataB:<v>,DataC:<v>\r\n
// at --rate Hz: three 10-amplitude, 0.2 Hz sines a quarter and a half period
// apart, with two decimals as a microcontroller's Serial.print() would.
// Lines written back by the host ("name:value") are reported on stderr.
//
// Usage: mock_device [--rate <Hz>] [--duration <sec>]
//        kvslog --port <printed path> --stats

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

#include <fcntl.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>

#include <kvs.h>
#include <kvs_line.h>
#include <kvs_serial.h>

static std::atomic<bool> g_running{true};

static bool write_all(int fd, const char *data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            // Nobody has the slave open yet: output queue full, drop the line
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return true;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

int main(int argc, char **argv) {
    double rate_hz = 200.0;
    double duration = std::numeric_limits<double>::infinity();
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--rate") == 0 && i + 1 < argc) {
            rate_hz = std::atof(argv[++i]);
            continue;
        }
        if (std::strcmp(argv[i], "--duration") == 0 && i + 1 < argc) {
            duration = std::atof(argv[++i]);
            continue;
        }
        std::fprintf(stderr, "Usage: %s [--rate <Hz>] [--duration <sec>]\n", argv[0]);
        return 2;
    }
    if (!(rate_hz > 0.0) || !(duration > 0.0)) {
        std::fprintf(stderr, "mock_device: --rate and --duration must be positive\n");
        return 2;
    }

    int master = -1;
    int slave = -1;
    char slave_name[256] = {};
    if (openpty(&master, &slave, slave_name, nullptr, nullptr) != 0) {
        std::perror("mock_device: openpty");
        return 1;
    }
    // Raw slave so the host sees bytes unmodified
    termios tio{};
    if (tcgetattr(slave, &tio) == 0) {
        cfmakeraw(&tio);
        tcsetattr(slave, TCSANOW, &tio);
    }

    // Commands from the host arrive on the master side
    kvs::FdLineTransport commands;
    if (!commands.attach(master, true)) {
        std::perror("mock_device: fcntl");
        ::close(slave);
        return 1;
    }

    std::signal(SIGINT, [](int) { g_running.store(false); });
    std::signal(SIGTERM, [](int) { g_running.store(false); });

    std::printf("%s\n", slave_name);
    std::fflush(stdout);
    std::fprintf(stderr, "mock_device: streaming at %.0f Hz on %s (Ctrl+C to stop)\n", rate_hz,
                 slave_name);

    const double pi = 3.14159265358979;
    kvs::Timer timer(rate_hz);
    auto t0 = std::chrono::steady_clock::now();
    char line[128];
    std::string cmd;
    int rc = 0;

    while (g_running.load()) {
        timer.wait();
        double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        if (t >= duration)
            break;

        double w = 2.0 * pi * 0.2 * t;
        int n = std::snprintf(line, sizeof(line), "Time:%.2f,DataA:%.2f,DataB:%.2f,DataC:%.2f\r\n",
                              t, 10.0 * std::sin(w), 10.0 * std::sin(w + pi / 2.0),
                              10.0 * std::sin(w + pi));
        if (!write_all(commands.fd(), line, static_cast<size_t>(n))) {
            std::perror("mock_device: write");
            rc = 1;
            break;
        }

        while (commands.is_line_available()) {
            if (commands.read_line(cmd) != kvs::ReadStatus::Line)
                break;
            std::string_view body = kvs::trim(cmd);
            size_t colon = body.find(kvs::kPairSep);
            if (colon == std::string_view::npos) {
                std::fprintf(stderr, "mock_device: ignored '%.*s'\n",
                             static_cast<int>(body.size()), body.data());
                continue;
            }
            double value = kvs::parse_number(body.substr(colon + 1));
            std::fprintf(stderr, "mock_device: command %.*s = %g\n", static_cast<int>(colon),
                         body.data(), value);
        }
    }

    ::close(slave);
    return rc;
}
