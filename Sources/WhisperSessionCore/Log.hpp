#pragma once

#include <functional>
#include <string>

namespace ws::log {

enum class Level {
    debug = 0,
    info,
    warn,
    error,
    silent
};

const char* level_to_string(Level level);

/// Receives every message at or above the current level.  Thread-safe to
/// replace at any time; the default sink writes "[level] message" to stderr.
using Sink = std::function<void(Level level, const std::string& message)>;

void set_level(Level level);
Level level();

/// Pass nullptr to restore the stderr sink.
void set_sink(Sink sink);

void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::debug, message); }
inline void info(const std::string& message)  { write(Level::info, message); }
inline void warn(const std::string& message)  { write(Level::warn, message); }
inline void error(const std::string& message) { write(Level::error, message); }

/// Send whisper.cpp / ggml log output through this logger instead of letting
/// the engine print to stderr on its own.  Idempotent.
void route_whisper_logs();

} // namespace ws::log
