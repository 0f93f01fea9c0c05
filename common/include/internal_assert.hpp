#pragma once

#include <log.hpp>
#include <macros.hpp>

#include <cstdlib>
#include <source_location>
#include <string_view>

namespace detail {

[[noreturn]] inline void InternalAssertFail(
    std::string_view condition, std::string_view message,
    const std::source_location& loc) {
    Log(LogLevel::kError, "{}:{}: condition `{}` failed{}{}", loc.file_name(),
        loc.line(), condition, message.empty() ? "" : ": ", message);
    std::abort();
}

}  // namespace detail

// Fatal check, stays enabled in release builds
#define INTERNAL_ASSERT(cond)                                                  \
    do {                                                                       \
        if (!(cond)) [[unlikely]] {                                            \
            ::detail::InternalAssertFail(#cond, {},                            \
                                         std::source_location::current());     \
        }                                                                      \
    } while (false)

#define INTERNAL_ASSERT_MSG(cond, message)                                     \
    do {                                                                       \
        if (!(cond)) [[unlikely]] {                                            \
            ::detail::InternalAssertFail(#cond, message,                       \
                                         std::source_location::current());     \
        }                                                                      \
    } while (false)
