#pragma once
/// @file kvs_serial.h
/// @brief Line-oriented byte transports: any POSIX fd, or a serial tty
///
/// The stream pump only needs "lines of text arrive". LineTransport is that
/// contract; FdLineTransport frames LF-terminated lines out of a
/// non-blocking file descriptor (pipe, pty, socket), and SerialPort opens and
/// configures a tty (raw 8N1, chosen baud rate) on top of it.

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace kvs {

/// Bytes buffered without a terminator before the partial line is dropped.
static constexpr size_t kMaxLineBytes = 4096;

enum class ReadStatus { Line, Empty, Closed, Error };

inline const char *read_status_str(ReadStatus s) {
    switch (s) {
    case ReadStatus::Line:
        return "line";
    case ReadStatus::Empty:
        return "empty";
    case ReadStatus::Closed:
        return "closed";
    case ReadStatus::Error:
        return "error";
    }
    return "unknown";
}

// ── LineTransport ───────────────────────────────────────────────────────────

class LineTransport {
  public:
    virtual ~LineTransport() = default;

    /// Non-blocking: true when read_line() would return a complete line.
    virtual bool is_line_available() = 0;

    /// Pop one line (terminator stripped). Returns Empty when no complete
    /// line is buffered, Closed/Error once the byte stream has ended.
    virtual ReadStatus read_line(std::string &line) = 0;

    /// Send one line; a '\n' is appended when missing.
    virtual bool write_line(std::string_view line) = 0;

    /// True once the byte stream has ended and every buffered line has been
    /// read; read_line() then reports Closed or Error.
    virtual bool at_end() const = 0;

    virtual bool is_open() const = 0;
};

// ── FdLineTransport ─────────────────────────────────────────────────────────

class FdLineTransport : public LineTransport {
  protected:
    int fd_ = -1;
    bool owns_fd_ = false;
    int saved_flags_ = -1; // restored on close() of a borrowed fd

  private:
    std::string buf_;
    ReadStatus end_state_ = ReadStatus::Empty; // Closed/Error once the stream ends
    bool discarding_ = false;                  // inside an oversized line
    uint64_t overflow_count_ = 0;

    static constexpr size_t kReadChunk = 4096;
    static constexpr size_t kMaxFillBytes = 64 * 1024;
    static constexpr int kWriteTimeoutMs = 100;

    /// Pull whatever the fd has right now into buf_.
    void fill() {
        if (fd_ < 0 || end_state_ != ReadStatus::Empty)
            return;

        char chunk[kReadChunk];
        size_t total = 0;
        while (total < kMaxFillBytes) {
            ssize_t n = ::read(fd_, chunk, sizeof(chunk));
            if (n > 0) {
                buf_.append(chunk, static_cast<size_t>(n));
                total += static_cast<size_t>(n);
                continue;
            }
            if (n == 0) {
                end_state_ = ReadStatus::Closed;
                break;
            }
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            // EIO: pty peer hung up
            end_state_ = (errno == EIO) ? ReadStatus::Closed : ReadStatus::Error;
            break;
        }

        if (discarding_) {
            size_t nl = buf_.find('\n');
            if (nl == std::string::npos) {
                buf_.clear();
            } else {
                buf_.erase(0, nl + 1);
                discarding_ = false;
            }
        }

        size_t last_nl = buf_.rfind('\n');
        size_t tail = (last_nl == std::string::npos) ? 0 : last_nl + 1;
        if (buf_.size() - tail > kMaxLineBytes) {
            buf_.erase(tail);
            overflow_count_++;
            discarding_ = true;
        }
    }

    bool has_buffered_line() const {
        if (buf_.find('\n') != std::string::npos)
            return true;
        // A final unterminated line is delivered once the stream has ended
        return end_state_ != ReadStatus::Empty && !buf_.empty() && !discarding_;
    }

  public:
    FdLineTransport() = default;

    explicit FdLineTransport(int fd, bool owns_fd = true) { attach(fd, owns_fd); }

    ~FdLineTransport() override { close(); }

    /// Take over an already-open fd and switch it to non-blocking mode.
    /// Failure modes: returns false (and does not keep the fd) if the fd is
    /// invalid or fcntl fails.
    bool attach(int fd, bool owns_fd = true) {
        close();
        if (fd < 0)
            return false;
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            if (owns_fd)
                ::close(fd);
            return false;
        }
        fd_ = fd;
        owns_fd_ = owns_fd;
        saved_flags_ = owns_fd ? -1 : flags;
        return true;
    }

    /// Closes an owned fd. A borrowed fd (stdin) is left open with its
    /// original file status flags.
    void close() {
        if (fd_ >= 0 && owns_fd_)
            ::close(fd_);
        else if (fd_ >= 0 && saved_flags_ >= 0)
            fcntl(fd_, F_SETFL, saved_flags_);
        fd_ = -1;
        owns_fd_ = false;
        saved_flags_ = -1;
        buf_.clear();
        end_state_ = ReadStatus::Empty;
        discarding_ = false;
    }

    bool is_open() const override { return fd_ >= 0; }

    bool at_end() const override {
        if (fd_ < 0)
            return true;
        return end_state_ != ReadStatus::Empty && !has_buffered_line();
    }

    int fd() const { return fd_; }

    /// Lines dropped for exceeding kMaxLineBytes without a terminator.
    uint64_t overflow_count() const { return overflow_count_; }

    bool is_line_available() override {
        fill();
        return has_buffered_line();
    }

    ReadStatus read_line(std::string &line) override {
        if (!has_buffered_line())
            fill();
        size_t nl = buf_.find('\n');
        if (nl != std::string::npos) {
            line.assign(buf_, 0, nl);
            buf_.erase(0, nl + 1);
            return ReadStatus::Line;
        }
        if (end_state_ != ReadStatus::Empty) {
            if (!buf_.empty() && !discarding_) {
                line.swap(buf_);
                buf_.clear();
                return ReadStatus::Line;
            }
            return end_state_;
        }
        return ReadStatus::Empty;
    }

    bool write_line(std::string_view line) override {
        if (fd_ < 0)
            return false;
        std::string out(line);
        if (out.empty() || out.back() != '\n')
            out.push_back('\n');

        size_t off = 0;
        while (off < out.size()) {
            ssize_t n = ::write(fd_, out.data() + off, out.size() - off);
            if (n > 0) {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                struct pollfd pfd{};
                pfd.fd = fd_;
                pfd.events = POLLOUT;
                int pr = ::poll(&pfd, 1, kWriteTimeoutMs);
                if (pr > 0)
                    continue;
                if (pr < 0 && errno == EINTR)
                    continue;
            }
            return false;
        }
        return true;
    }

    // Non-copyable
    FdLineTransport(const FdLineTransport &) = delete;
    FdLineTransport &operator=(const FdLineTransport &) = delete;
};

// ── SerialPort ──────────────────────────────────────────────────────────────

/// Map a numeric baud rate to its termios constant. Returns false for rates
/// the tty layer has no constant for.
inline bool baud_to_speed(int baud, speed_t &speed) {
    switch (baud) {
    case 1200:
        speed = B1200;
        return true;
    case 2400:
        speed = B2400;
        return true;
    case 4800:
        speed = B4800;
        return true;
    case 9600:
        speed = B9600;
        return true;
    case 19200:
        speed = B19200;
        return true;
    case 38400:
        speed = B38400;
        return true;
    case 57600:
        speed = B57600;
        return true;
    case 115200:
        speed = B115200;
        return true;
    case 230400:
        speed = B230400;
        return true;
    case 460800:
        speed = B460800;
        return true;
    case 921600:
        speed = B921600;
        return true;
    default:
        return false;
    }
}

inline bool is_valid_baud(int baud) {
    speed_t s;
    return baud_to_speed(baud, s);
}

enum class OpenError {
    None,
    InvalidArgument,
    UnsupportedBaud,
    OpenFailed,
    NotATerminal,
    ConfigFailed,
};

inline const char *open_error_str(OpenError e) {
    switch (e) {
    case OpenError::None:
        return "ok";
    case OpenError::InvalidArgument:
        return "no device path";
    case OpenError::UnsupportedBaud:
        return "unsupported baud rate";
    case OpenError::OpenFailed:
        return "cannot open device";
    case OpenError::NotATerminal:
        return "not a terminal device";
    case OpenError::ConfigFailed:
        return "cannot configure terminal";
    }
    return "unknown";
}

class SerialPort : public FdLineTransport {
    std::string path_;
    int baud_ = 0;
    OpenError last_error_ = OpenError::None;
    int last_errno_ = 0;

    bool fail(OpenError err, int sys_errno, int fd = -1) {
        last_error_ = err;
        last_errno_ = sys_errno;
        if (fd >= 0)
            ::close(fd);
        return false;
    }

  public:
    SerialPort() = default;

    /// Open a tty and configure it raw 8N1 at `baud`.
    ///
    /// Preconditions: `path` names a terminal device (serial adapter or pty).
    /// Postconditions: on success, the port is non-blocking and its input
    ///   queue has been flushed. An idle port reads as Empty, not Closed.
    /// Failure modes: returns false and records last_error() on a missing
    ///   path, unknown baud rate, open failure, or when the device does not
    ///   accept terminal attributes. last_errno() is the errno of the failing
    ///   system call, 0 when no call failed.
    bool open(const char *path, int baud) {
        close();
        last_error_ = OpenError::None;
        last_errno_ = 0;
        speed_t speed;
        if (path == nullptr || path[0] == '\0')
            return fail(OpenError::InvalidArgument, 0);
        if (!baud_to_speed(baud, speed))
            return fail(OpenError::UnsupportedBaud, 0);

        int fd = ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0)
            return fail(OpenError::OpenFailed, errno);

        termios tio{};
        if (tcgetattr(fd, &tio) != 0)
            return fail(OpenError::NotATerminal, errno, fd);
        cfmakeraw(&tio);
        cfsetispeed(&tio, speed);
        cfsetospeed(&tio, speed);
        tio.c_cflag |= (CLOCAL | CREAD);
        tio.c_cflag &= ~static_cast<tcflag_t>(CSTOPB | PARENB);
        // VMIN=0 makes an idle read() return 0, indistinguishable from a
        // hangup. With VMIN=1 and O_NONBLOCK an idle read fails with EAGAIN.
        tio.c_cc[VMIN] = 1;
        tio.c_cc[VTIME] = 0;
        if (tcsetattr(fd, TCSANOW, &tio) != 0)
            return fail(OpenError::ConfigFailed, errno, fd);
        tcflush(fd, TCIFLUSH);

        if (!attach(fd, true))
            return fail(OpenError::ConfigFailed, errno);
        path_ = path;
        baud_ = baud;
        return true;
    }

    const std::string &path() const { return path_; }

    int baud() const { return baud_; }

    OpenError last_error() const { return last_error_; }

    int last_errno() const { return last_errno_; }

    /// "unsupported baud rate" or "cannot open device: No such file ..."
    std::string last_error_message() const {
        std::string msg = open_error_str(last_error_);
        if (last_errno_ != 0) {
            msg += ": ";
            msg += std::strerror(last_errno_);
        }
        return msg;
    }
};

} // namespace kvs
