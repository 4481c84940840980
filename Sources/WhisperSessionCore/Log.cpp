#include "Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "whisper.h"

namespace ws::log {

namespace {

std::atomic<Level> g_level{Level::info};
std::mutex         g_sink_mu;
Sink               g_sink;

void stderr_sink(Level level, const std::string& message) {
    std::cerr << "[" << level_to_string(level) << "] " << message << "\n";
}

Level from_ggml(enum ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: return Level::error;
        case GGML_LOG_LEVEL_WARN:  return Level::warn;
        case GGML_LOG_LEVEL_INFO:  return Level::info;
        default:                   return Level::debug;
    }
}

// ggml emits partial lines (progress dots, CONT fragments); buffer until '\n'.
void whisper_log_trampoline(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    static thread_local std::string pending;
    static thread_local Level pending_level = Level::debug;

    if (!text) return;
    if (level != GGML_LOG_LEVEL_CONT) {
        pending_level = from_ggml(level);
    }
    pending += text;

    std::string::size_type nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, nl);
        pending.erase(0, nl + 1);
        if (!line.empty()) {
            write(pending_level, "whisper: " + line);
        }
    }
}

} // namespace

const char* level_to_string(Level level) {
    switch (level) {
        case Level::debug:  return "debug";
        case Level::info:   return "info";
        case Level::warn:   return "warn";
        case Level::error:  return "error";
        case Level::silent: return "silent";
    }
    return "unknown";
}

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mu);
    g_sink = std::move(sink);
}

void write(Level level, const std::string& message) {
    if (level == Level::silent || level < g_level.load()) {
        return;
    }

    // Called outside the lock so a sink may log itself.
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mu);
        sink = g_sink;
    }
    if (sink) {
        sink(level, message);
    } else {
        stderr_sink(level, message);
    }
}

void route_whisper_logs() {
    static std::once_flag once;
    std::call_once(once, [] {
        whisper_log_set(whisper_log_trampoline, nullptr);
    });
}

} // namespace ws::log
