#include <calcexpr/log.hpp>

#include <atomic>
#include <cstdio>
#include <ctime>
#include <string>

namespace calcexpr {

static std::atomic<LogLevel> g_level{LogLevel::Warning};

void set_log_level(LogLevel level) noexcept { g_level.store(level); }

LogLevel log_level() noexcept { return g_level.load(); }

bool log_enabled(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= g_level.load();
}

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    for (char c : name) lower.push_back(static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c));

    if (lower == "debug")   return LogLevel::Debug;
    if (lower == "info")    return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error")   return LogLevel::Error;
    if (lower == "off")     return LogLevel::Off;
    return std::nullopt;
}

// [LEVEL][epoch][message][file___line]
void log_message(LogLevel level, std::string_view message, const char* file_name, int line) {
    fmt::print(stderr, "[{}][{}][{}][{}___{}]\n",
               to_string(level), static_cast<long long>(std::time(nullptr)), message, file_name, line);
}

} // namespace calcexpr
