#pragma once
/// @file kvs_csv.h
/// @brief Persistence sink: per-line sample rows with a growing header
///
/// The stream pump pushes a schema change whenever a signal is registered
/// and one row per stored line, ordered like the current header ("Time"
/// first, then signals in registration order).

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kvs {

class PersistenceSink {
  public:
    virtual ~PersistenceSink() = default;

    /// Header grew. `headers` is the complete new header, "Time" first.
    virtual void on_schema_changed(const std::vector<std::string> &headers) = 0;

    /// One row per stored line, aligned with the latest header. Signals
    /// absent from the line are NaN.
    virtual void on_line(std::span<const double> values) = 0;
};

/// Format a row: "%.15g" per value, NaN as an empty cell.
inline std::string format_csv_row(std::span<const double> values) {
    std::string row;
    row.reserve(values.size() * 12);
    char buf[32];
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
            row.push_back(',');
        if (std::isnan(values[i]))
            continue;
        int n = std::snprintf(buf, sizeof(buf), "%.15g", values[i]);
        if (n > 0)
            row.append(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n)
                                                                 : sizeof(buf) - 1);
    }
    return row;
}

inline std::string format_csv_header(const std::vector<std::string> &headers) {
    std::string line;
    for (size_t i = 0; i < headers.size(); ++i) {
        if (i > 0)
            line.push_back(',');
        line += headers[i];
    }
    return line;
}

// ── CsvSink ─────────────────────────────────────────────────────────────────

/// CSV file writer. A header change rewrites the file in place (through a
/// temporary next to it) with the new header, keeping every row written so
/// far padded with empty cells for the new columns.
class CsvSink : public PersistenceSink {
    std::string path_;
    FILE *fp_ = nullptr;
    std::string header_;
    size_t columns_ = 0;
    uint64_t rows_ = 0;
    uint64_t write_errors_ = 0;

    void record_error(const char *what) {
        if (write_errors_++ == 0)
            std::fprintf(stderr, "kvs: csv %s failed for '%s': %s\n", what, path_.c_str(),
                         std::strerror(errno));
    }

    bool read_rows(std::string &rows) {
        FILE *in = std::fopen(path_.c_str(), "r");
        if (!in)
            return false;
        std::string all;
        char chunk[8192];
        size_t n;
        while ((n = std::fread(chunk, 1, sizeof(chunk), in)) > 0)
            all.append(chunk, n);
        bool ok = !std::ferror(in);
        std::fclose(in);
        if (!ok)
            return false;
        size_t nl = all.find('\n');
        rows = (nl == std::string::npos) ? std::string() : all.substr(nl + 1);
        return true;
    }

    static void pad_row(std::string &out, std::string_view row, size_t columns) {
        out.append(row);
        size_t fields = 1;
        for (char c : row) {
            if (c == ',')
                fields++;
        }
        for (; fields < columns; ++fields)
            out.push_back(',');
        out.push_back('\n');
    }

  public:
    CsvSink() = default;

    ~CsvSink() override { close(); }

    /// Create (truncate) the output file. Nothing is written until the first
    /// schema change.
    bool open(const char *path) {
        close();
        if (path == nullptr || path[0] == '\0')
            return false;
        fp_ = std::fopen(path, "w");
        if (!fp_)
            return false;
        path_ = path;
        header_.clear();
        columns_ = 0;
        rows_ = 0;
        write_errors_ = 0;
        return true;
    }

    void close() {
        if (fp_) {
            std::fclose(fp_);
            fp_ = nullptr;
        }
    }

    bool is_open() const { return fp_ != nullptr; }

    const std::string &path() const { return path_; }

    uint64_t rows() const { return rows_; }

    uint64_t write_errors() const { return write_errors_; }

    void on_schema_changed(const std::vector<std::string> &headers) override {
        if (!fp_)
            return;
        std::string header = format_csv_header(headers);
        if (columns_ > 0 && header == header_)
            return;

        if (rows_ == 0) {
            // Nothing logged yet: just replace the header
            std::fclose(fp_);
            fp_ = std::fopen(path_.c_str(), "w");
            if (!fp_ || std::fprintf(fp_, "%s\n", header.c_str()) < 0 || std::fflush(fp_) != 0) {
                record_error("header write");
                return;
            }
            header_ = header;
            columns_ = headers.size();
            return;
        }

        std::fflush(fp_);
        std::string rows;
        if (!read_rows(rows)) {
            record_error("read-back");
            return;
        }

        std::string body;
        body.reserve(header.size() + rows.size() + rows_ * 4);
        body += header;
        body.push_back('\n');
        size_t pos = 0;
        while (pos < rows.size()) {
            size_t nl = rows.find('\n', pos);
            size_t end = (nl == std::string::npos) ? rows.size() : nl;
            pad_row(body, std::string_view(rows).substr(pos, end - pos), headers.size());
            pos = end + 1;
        }

        std::string tmp = path_ + ".tmp";
        FILE *out = std::fopen(tmp.c_str(), "w");
        if (!out) {
            record_error("rewrite");
            return;
        }
        bool ok = std::fwrite(body.data(), 1, body.size(), out) == body.size();
        ok = (std::fclose(out) == 0) && ok;
        if (!ok || std::rename(tmp.c_str(), path_.c_str()) != 0) {
            std::remove(tmp.c_str());
            record_error("rewrite");
            return;
        }

        std::fclose(fp_);
        fp_ = std::fopen(path_.c_str(), "a");
        if (!fp_) {
            record_error("reopen");
            return;
        }
        header_ = header;
        columns_ = headers.size();
    }

    void on_line(std::span<const double> values) override {
        if (!fp_)
            return;
        std::string row = format_csv_row(values);
        for (size_t i = values.empty() ? 1 : values.size(); i < columns_; ++i)
            row.push_back(',');
        row.push_back('\n');
        if (std::fwrite(row.data(), 1, row.size(), fp_) != row.size() || std::fflush(fp_) != 0) {
            record_error("row write");
            return;
        }
        rows_++;
    }

    // Non-copyable
    CsvSink(const CsvSink &) = delete;
    CsvSink &operator=(const CsvSink &) = delete;
};

} // namespace kvs
