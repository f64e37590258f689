#include "Log.hpp"
#include "Utils.hpp"

#include <mutex>
#include <atomic>
#include <chrono>

namespace {
    std::atomic<LogLevel> g_level{ LogLevel::Info };
    std::atomic<std::FILE*> g_sink{ stderr };
    std::mutex g_write_mutex;

    std::string_view tag(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info:  return "info";
            case LogLevel::Warn:  return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off:   break;
        }
        return "";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off")   return LogLevel::Off;
    return std::nullopt;
}

void Log::configure(LogLevel level, std::FILE* sink) {
    g_level.store(level, std::memory_order_release);
    g_sink.store(sink ? sink : stderr, std::memory_order_release);
}

LogLevel Log::level() { return g_level.load(std::memory_order_acquire); }

void Log::emit(LogLevel lvl, const std::string& message) {
    auto* sink = g_sink.load(std::memory_order_acquire);

    std::scoped_lock lock(g_write_mutex);
    std::println(sink, "[{}] [{}] {}", clock_string(std::chrono::system_clock::now()), tag(lvl), message);
    std::fflush(sink);
}
