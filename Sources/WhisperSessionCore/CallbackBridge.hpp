#pragma once

#include "Types.hpp"

#include <memory>
#include <vector>

namespace ws {

class ParameterSet;
class TranscriptionEngine;

/// Receiver of native callbacks, implemented by EngineSession.
/// Called on the engine's threads while a run is in progress.
class CallbackSink {
public:
    virtual ~CallbackSink() = default;

    /// Engine whose segments the new-segment callback reads.
    virtual const TranscriptionEngine& callback_engine() const = 0;

    /// Polled by the encoder-begin callback; false aborts the run.
    virtual bool should_continue() const = 0;

    virtual void handle_progress(float fraction) = 0;
    virtual void handle_new_segments(std::vector<Segment> segments, int start_index) = 0;
};

/// Opaque value stored in the native user-data slots.
///
/// Holds a weak reference to the sink and upgrades it for the duration of
/// each callback, so the sink cannot disappear mid-callback and a token
/// outliving its sink only makes the callbacks no-ops.
class CallbackToken {
public:
    explicit CallbackToken(std::weak_ptr<CallbackSink> sink) : sink_(std::move(sink)) {}

    std::shared_ptr<CallbackSink> acquire() const { return sink_.lock(); }

    void* opaque() { return this; }
    static CallbackToken* from_opaque(void* user_data) {
        return static_cast<CallbackToken*>(user_data);
    }

private:
    std::weak_ptr<CallbackSink> sink_;
};

/// Installs the progress, new-segment and encoder-begin trampolines into a
/// ParameterSet and owns the token they carry.
///
/// At most one token exists per bridge.  Re-wiring installs a fresh token
/// before releasing the previous one, so the native struct never points at a
/// freed token.
class CallbackBridge {
public:
    CallbackBridge() = default;
    ~CallbackBridge() = default;

    // Non-copyable.
    CallbackBridge(const CallbackBridge&) = delete;
    CallbackBridge& operator=(const CallbackBridge&) = delete;

    void wire(ParameterSet& params, std::weak_ptr<CallbackSink> sink);

    /// Clear every callback and user-data field, then drop the token.
    void unwire(ParameterSet& params);

    bool is_wired() const { return token_ != nullptr; }

    /// Address currently installed as user data, or null.
    const void* token_address() const { return token_.get(); }

    /// Decode segments [begin, end) exactly as delivered to delegates:
    /// timestamps scaled to milliseconds, undecodable text skipped.
    static std::vector<Segment> read_segments(const TranscriptionEngine& engine, int begin, int end);

private:
    std::unique_ptr<CallbackToken> token_;
};

} // namespace ws
