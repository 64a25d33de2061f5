#pragma once

#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace calcexpr {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel level) noexcept;

const char* to_string(LogLevel level) noexcept;
std::optional<LogLevel> parse_log_level(std::string_view name);

void log_message(LogLevel level, std::string_view message, const char* file_name, int line);

} // namespace calcexpr

// CALCEXPR_LOG(Debug, "evaluated {}", x)
#define CALCEXPR_LOG(level, ...)                                                   \
    do {                                                                           \
        if (::calcexpr::log_enabled(::calcexpr::LogLevel::level))                  \
            ::calcexpr::log_message(::calcexpr::LogLevel::level,                   \
                                    ::fmt::format(__VA_ARGS__), __FILE__, __LINE__); \
    } while (0)
