#pragma once

#include <fmt/color.h>
#include <fmt/core.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

enum class LogLevel {
    kError = 0,
    kWarning = 1,
    kInfo = 2,
    kDebug = 3,
};

namespace detail {

inline LogLevel ParseLogLevel(const char* value, LogLevel fallback) {
    if (value == nullptr) {
        return fallback;
    }
    std::string_view text{value};
    if (text == "error") {
        return LogLevel::kError;
    }
    if (text == "warning" || text == "warn") {
        return LogLevel::kWarning;
    }
    if (text == "info") {
        return LogLevel::kInfo;
    }
    if (text == "debug") {
        return LogLevel::kDebug;
    }
    return fallback;
}

inline std::atomic<LogLevel>& CurrentLogLevel() {
    static std::atomic<LogLevel> level{
        ParseLogLevel(std::getenv("LISTS_LOG_LEVEL"), LogLevel::kInfo)};
    return level;
}

inline std::string LevelTag(LogLevel level) {
    struct Tag {
        std::string_view name;
        fmt::color color;
    };
    static constexpr Tag kTags[] = {
        {"ERROR", fmt::color::red},
        {"WARN", fmt::color::yellow},
        {"INFO", fmt::color::green},
        {"DEBUG", fmt::color::gray},
    };

    const auto& tag = kTags[static_cast<int>(level)];
    static const bool kColored = isatty(fileno(stderr)) != 0;
    if (!kColored) {
        return std::string{tag.name};
    }
    return fmt::format(fmt::fg(tag.color), "{}", tag.name);
}

}  // namespace detail

inline void SetLogLevel(LogLevel level) {
    detail::CurrentLogLevel().store(level, std::memory_order_relaxed);
}

inline bool LogEnabled(LogLevel level) {
    return level <=
           detail::CurrentLogLevel().load(std::memory_order_relaxed);
}

template <class... Args>
void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!LogEnabled(level)) {
        return;
    }
    fmt::print(stderr, "{} {}\n", detail::LevelTag(level),
               fmt::format(format, std::forward<Args>(args)...));
}
