#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace ws {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class SamplingStrategy {
    greedy,
    beam_search
};

/// Lifecycle of an EngineSession run.
enum class SessionState {
    idle,
    running,
    stopping    // stop() requested, engine has not returned yet
};

/// Convert state enum to a printable name.
inline const char* state_to_string(SessionState s) {
    switch (s) {
        case SessionState::idle:     return "idle";
        case SessionState::running:  return "running";
        case SessionState::stopping: return "stopping";
    }
    return "unknown";
}

inline const char* strategy_to_string(SamplingStrategy s) {
    switch (s) {
        case SamplingStrategy::greedy:      return "greedy";
        case SamplingStrategy::beam_search: return "beam_search";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// One timestamped unit of recognized text.
struct Segment {
    int64_t     start_time;     // milliseconds
    int64_t     end_time;       // milliseconds
    std::string text;           // UTF-8
};

inline bool operator==(const Segment& a, const Segment& b) {
    return a.start_time == b.start_time && a.end_time == b.end_time && a.text == b.text;
}

inline bool operator!=(const Segment& a, const Segment& b) {
    return !(a == b);
}

/// whisper.cpp reports segment timestamps in hundredths of a second.
constexpr int64_t kNativeTimeToMs = 10;

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired exactly once per accepted run on the notification context.
/// `error` is null on success (including a run cut short by stop()).
using CompletionHandler =
    std::function<void(const std::vector<Segment>& segments, std::exception_ptr error)>;

} // namespace ws
