#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>

namespace tracesdk::utils {

// ============================================================================
// Random Identifiers
// ============================================================================

/// Lowercase hex string of `bytes` random bytes (2 * bytes characters).
inline std::string random_hex(size_t bytes) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    static constexpr char kHex[] = "0123456789abcdef";

    std::string result;
    result.reserve(bytes * 2);

    size_t remaining = bytes;
    while (remaining > 0) {
        uint64_t val = dis(gen);
        const size_t chunk = std::min(remaining, size_t(8));
        for (size_t i = 0; i < chunk; ++i) {
            const auto byte = static_cast<uint8_t>(val >> (i * 8));
            result += kHex[byte >> 4];
            result += kHex[byte & 0x0F];
        }
        remaining -= chunk;
    }

    return result;
}

/// UUID v4 rendered as 32 lowercase hex characters without dashes (event ids).
inline std::string generate_uuid() {
    std::string id = random_hex(16);
    id[12] = '4';
    static constexpr char kVariant[] = "89ab";
    id[16] = kVariant[static_cast<unsigned char>(id[16]) % 4];
    return id;
}

// ============================================================================
// Time Utilities
// ============================================================================

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/// Seconds since the Unix epoch with sub-second precision.
inline double timestamp_in_seconds(std::chrono::system_clock::time_point tp = now()) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

/// ISO-8601 UTC with millisecond precision, e.g. "2021-03-04T05:06:07.089Z".
inline std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", time_buf, static_cast<int>(ms.count()));
    return out;
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

/// Lowercase hex only ([0-9a-f]), non-empty.
[[nodiscard]] inline bool is_lower_hex(std::string_view s) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

/// Percent-encode everything outside RFC 3986 unreserved characters.
[[nodiscard]] inline std::string url_encode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0F];
        }
    }
    return out;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

using Sink = std::function<void(Level, const std::string&)>;

inline constexpr const char* level_name(Level level) {
    switch (level) {
        case Level::DEBUG: return "debug";
        case Level::INFO:  return "info";
        case Level::WARN:  return "warn";
        case Level::ERROR: return "error";
    }
    return "info";
}

[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline Level& min_level() {
        static Level level = Level::INFO;
        return level;
    }

    inline Sink& sink() {
        static Sink s;
        return s;
    }

    inline void write_stderr(Level level, const std::string& msg) {
        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        char prefix[40];
        std::snprintf(prefix, sizeof(prefix), "%s.%03d [%s] ",
            time_buf, static_cast<int>(ms.count()), tag);

        std::cerr << prefix << msg << '\n';
    }

    // The sink is called unlocked so that it may log itself
    inline void write(Level level, const std::string& msg) {
        Sink current;
        {
            std::lock_guard<std::mutex> lock(log_mutex());
            if (level < min_level()) return;
            if (!sink()) {
                write_stderr(level, msg);
                return;
            }
            current = sink();
        }
        current(level, msg);
    }
} // namespace detail

inline void set_level(Level level) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::min_level() = level;
}

[[nodiscard]] inline Level get_level() {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    return detail::min_level();
}

/// Replace the stderr writer (pass an empty Sink to restore it).
inline void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::sink() = std::move(sink);
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace tracesdk::utils
