#pragma once
/// @file kvs_line.h
/// @brief Record wire format: comma-separated `key:value` lines
///
/// A record is one ASCII line of fields separated by ','. Each field is a
/// `key:value` pair; the key "Time" carries the record timestamp, every other
/// key names a signal sample. There is no escaping of ',' or ':'. Whitespace
/// around keys and values is ignored, so a CRLF terminator decodes the same
/// as LF.

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>

#include <kvs.h>

namespace kvs {

static constexpr std::string_view kTimeKey = "Time";
static constexpr char kFieldSep = ',';
static constexpr char kPairSep = ':';

enum class DecodeError { None, MissingTimestamp };

inline const char *decode_error_str(DecodeError e) {
    switch (e) {
    case DecodeError::None:
        return "ok";
    case DecodeError::MissingTimestamp:
        return "missing Time field";
    }
    return "unknown";
}

struct DecodeResult {
    DecodeError error = DecodeError::None;
    DecodedLine line;

    bool ok() const { return error == DecodeError::None; }
};

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

inline std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b]))
        ++b;
    while (e > b && is_space(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

/// Parse a decimal floating-point value. The whole (trimmed) text must be
/// consumed; anything else, including an empty value, yields NaN.
inline double parse_number(std::string_view text) {
    std::string_view s = trim(text);
    if (s.empty())
        return std::numeric_limits<double>::quiet_NaN();

    char buf[64];
    std::string heap;
    const char *cstr = nullptr;
    if (s.size() < sizeof(buf)) {
        std::memcpy(buf, s.data(), s.size());
        buf[s.size()] = '\0';
        cstr = buf;
    } else {
        heap.assign(s);
        cstr = heap.c_str();
    }

    // strtod also takes hex floats; the wire format is decimal only
    if (std::strpbrk(cstr, "xX") != nullptr)
        return std::numeric_limits<double>::quiet_NaN();

    char *end = nullptr;
    double v = std::strtod(cstr, &end);
    if (end == cstr || *end != '\0')
        return std::numeric_limits<double>::quiet_NaN();
    return v;
}

/// Decode one wire line into a timestamp and its named samples.
///
/// Fields without exactly one ':' or with an empty key are skipped and
/// counted in `malformed_fields`. A value that does not parse is kept as NaN.
/// A key repeated on the same line keeps its first position and its last
/// value. Fails with MissingTimestamp, and returns no samples, when no
/// parseable "Time" field is present.
inline DecodeResult decode_line(std::string_view text) {
    DecodeResult result;
    DecodedLine &out = result.line;

    bool have_time = false;
    size_t pos = 0;
    for (;;) {
        size_t comma = text.find(kFieldSep, pos);
        std::string_view field =
            text.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);

        size_t colon = field.find(kPairSep);
        if (colon == std::string_view::npos ||
            field.find(kPairSep, colon + 1) != std::string_view::npos) {
            out.malformed_fields++;
        } else {
            std::string_view key = trim(field.substr(0, colon));
            if (key.empty()) {
                out.malformed_fields++;
            } else {
                double value = parse_number(field.substr(colon + 1));
                if (key == kTimeKey) {
                    out.timestamp = value;
                    have_time = true;
                } else {
                    bool found = false;
                    for (auto &s : out.samples) {
                        if (s.first == key) {
                            s.second = value;
                            found = true;
                            break;
                        }
                    }
                    if (!found)
                        out.samples.emplace_back(std::string(key), value);
                }
            }
        }

        if (comma == std::string_view::npos)
            break;
        pos = comma + 1;
    }

    if (!have_time || std::isnan(out.timestamp)) {
        result.error = DecodeError::MissingTimestamp;
        out.samples.clear();
    }
    return result;
}

// ── Encoding ────────────────────────────────────────────────────────────────

inline void append_number(std::string &dst, double value) {
    char buf[32];
    int n = std::snprintf(buf, sizeof(buf), "%.15g", value);
    if (n > 0)
        dst.append(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n)
                                                              : sizeof(buf) - 1);
}

/// Encode a record as a newline-terminated wire line, "Time" first.
inline std::string encode_line(const DecodedLine &line) {
    std::string out;
    out.reserve(16 + line.samples.size() * 16);
    out.append(kTimeKey);
    out.push_back(kPairSep);
    append_number(out, line.timestamp);
    for (const auto &[name, value] : line.samples) {
        out.push_back(kFieldSep);
        out.append(name);
        out.push_back(kPairSep);
        append_number(out, value);
    }
    out.push_back('\n');
    return out;
}

/// Outbound command for the device: "name:value\n".
inline std::string encode_command(std::string_view name, double value) {
    std::string out(trim(name));
    out.push_back(kPairSep);
    append_number(out, value);
    out.push_back('\n');
    return out;
}

} // namespace kvs
