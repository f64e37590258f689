#pragma once

#include <cstdio>
#include <print>
#include <format>
#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

enum class LogLevel: uint8_t { Debug = 0, Info, Warn, Error, Off };

std::optional<LogLevel> parse_log_level(std::string_view name);

// process-wide diagnostics sink, stderr unless redirected
class Log {
public:
    static void configure(LogLevel level, std::FILE* sink);
    static LogLevel level();

    template <typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args) { write(LogLevel::Debug, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args) { write(LogLevel::Info, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args) { write(LogLevel::Warn, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args) { write(LogLevel::Error, fmt, std::forward<Args>(args)...); }

private:
    template <typename... Args>
    static void write(LogLevel lvl, std::format_string<Args...> fmt, Args&&... args) {
        if (lvl < level()) return;
        emit(lvl, std::format(fmt, std::forward<Args>(args)...));
    }

    static void emit(LogLevel lvl, const std::string& message);
};
