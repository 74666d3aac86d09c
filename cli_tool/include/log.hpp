#pragma once

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Log {
enum class Level { None = -1, Error = 0, Warn = 1, Info = 2, Debug = 3 };

namespace detail {
inline Level& current_level() {
    static Level level = Level::Info;
    return level;
}

inline std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

inline bool use_color() {
    static const bool color = ::isatty(STDERR_FILENO) != 0;
    return color;
}
}  // namespace detail

inline void set_level(Level level) { detail::current_level() = level; }
inline Level level() { return detail::current_level(); }
inline bool enabled(Level level) { return level != Level::None && level <= detail::current_level(); }

inline std::optional<Level> parse_level(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if (upper == "ERROR") return Level::Error;
    if (upper == "WARN" || upper == "WARNING") return Level::Warn;
    if (upper == "INFO") return Level::Info;
    if (upper == "DEBUG") return Level::Debug;
    if (upper == "NONE") return Level::None;
    return std::nullopt;
}

inline void write(Level level, std::string_view message) {
    if (!enabled(level)) return;
    std::string_view tag = "[INFO] ";
    std::string_view color = "\033[32m";
    switch (level) {
        case Level::Error:
            tag = "[ERROR] ";
            color = "\033[31m";
            break;
        case Level::Warn:
            tag = "[WARN] ";
            color = "\033[33m";
            break;
        case Level::Debug:
            tag = "[DEBUG] ";
            color = "\033[33m";
            break;
        default:
            break;
    }
    std::lock_guard<std::mutex> lock(detail::output_mutex());
    if (detail::use_color()) {
        std::cerr << color << tag << message << "\033[0m" << std::endl;
    } else {
        std::cerr << tag << message << std::endl;
    }
}

inline void error(std::string_view message) { write(Level::Error, message); }
inline void warn(std::string_view message) { write(Level::Warn, message); }
inline void info(std::string_view message) { write(Level::Info, message); }
inline void debug(std::string_view message) { write(Level::Debug, message); }
}  // namespace Log
