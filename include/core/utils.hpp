#pragma once

#include <string>
#include <string_view>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <random>
#include <format>
#include <sstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <vector>

namespace sqlcomposer::utils {

// ============================================================================
// UUID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

/**
 * @brief True for SQL numeric literals: [+-]digits[.digits][(e|E)[+-]digits]
 *
 * A leading or trailing '.' is accepted when the other side has digits
 * (".5", "5."). Whitespace, hex and "Infinity" are not numeric.
 */
[[nodiscard]] inline bool is_numeric_literal(std::string_view sv) {
    size_t i = 0;
    if (i < sv.size() && (sv[i] == '+' || sv[i] == '-')) ++i;

    size_t int_digits = 0;
    while (i < sv.size() && std::isdigit(static_cast<unsigned char>(sv[i]))) { ++i; ++int_digits; }

    size_t frac_digits = 0;
    if (i < sv.size() && sv[i] == '.') {
        ++i;
        while (i < sv.size() && std::isdigit(static_cast<unsigned char>(sv[i]))) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;

    if (i < sv.size() && (sv[i] == 'e' || sv[i] == 'E')) {
        ++i;
        if (i < sv.size() && (sv[i] == '+' || sv[i] == '-')) ++i;
        size_t exp_digits = 0;
        while (i < sv.size() && std::isdigit(static_cast<unsigned char>(sv[i]))) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == sv.size();
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = std::tolower(static_cast<unsigned char>(c));
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

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// SQL String Utilities
// ============================================================================

/**
 * @brief Render a single-quoted SQL string literal, doubling embedded quotes.
 */
[[nodiscard]] inline std::string quote_literal(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 2);
    result += '\'';
    for (const char c : s) {
        if (c == '\'') result += '\'';
        result += c;
    }
    result += '\'';
    return result;
}

/**
 * @brief Render a double-quoted SQL identifier, doubling embedded quotes.
 */
[[nodiscard]] inline std::string quote_identifier(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 2);
    result += '"';
    for (const char c : s) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& threshold() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < threshold().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
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

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

// "info", "warn"/"warning", "error"; nullopt for anything else
[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
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

} // namespace sqlcomposer::utils
