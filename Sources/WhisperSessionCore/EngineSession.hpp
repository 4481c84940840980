#pragma once

#include "CallbackBridge.hpp"
#include "NotificationContext.hpp"
#include "ParameterSet.hpp"
#include "TranscriptionEngine.hpp"
#include "Types.hpp"
#include "WhisperCppEngine.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ws {

class EngineSession;

/// Observer of a session.  Every method runs on the session's notification
/// context and defaults to a no-op.
class SessionDelegate {
public:
    virtual ~SessionDelegate() = default;

    /// `fraction` is in [0, 1].
    virtual void on_progress(EngineSession& /*session*/, float /*fraction*/) {}

    /// `start_index` is the index of segments.front() in the final list.
    virtual void on_new_segments(EngineSession& /*session*/,
                                 const std::vector<Segment>& /*segments*/,
                                 int /*start_index*/) {}

    virtual void on_complete(EngineSession& /*session*/,
                             const std::vector<Segment>& /*segments*/) {}

    virtual void on_error(EngineSession& /*session*/, std::exception_ptr /*error*/) {}
};

/// One loaded model plus the parameters and callback wiring to run it.
///
/// Sessions are always held by shared_ptr: the worker thread and queued
/// notifications keep the session alive until they are done with it.
///
///     auto session = ws::EngineSession::from_file("ggml-base.en.bin");
///     session->set_delegate(my_delegate);
///     auto segments = session->transcribe(samples).get();
///
/// At most one run is in flight per session.  A run ends for the caller when
/// its completion (or error) is delivered on the notification context.
class EngineSession : public std::enable_shared_from_this<EngineSession>,
                      public CallbackSink {
public:
    // ---- Factories ----

    /// Throws ConstructionError if the model cannot be loaded.
    /// With no `context` the session creates its own SerialQueue.
    static std::shared_ptr<EngineSession> from_file(
        const std::string& model_path,
        ParameterSet params = ParameterSet(),
        const EngineOptions& options = {},
        std::shared_ptr<NotificationContext> context = nullptr);

    static std::shared_ptr<EngineSession> from_buffer(
        const std::vector<uint8_t>& model_bytes,
        ParameterSet params = ParameterSet(),
        const EngineOptions& options = {},
        std::shared_ptr<NotificationContext> context = nullptr);

    /// Wrap an already constructed engine.
    static std::shared_ptr<EngineSession> with_engine(
        std::unique_ptr<TranscriptionEngine> engine,
        ParameterSet params = ParameterSet(),
        std::shared_ptr<NotificationContext> context = nullptr);

    ~EngineSession() override;

    // Non-copyable.
    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;

    // ---- Configuration ----

    const ParameterSet& params() const { return params_; }

    /// Replace the parameters and re-wire callbacks into the new copy.
    /// Throws ConcurrencyViolation while a run is in flight.
    void set_params(const ParameterSet& params);

    void set_delegate(std::shared_ptr<SessionDelegate> delegate);
    std::shared_ptr<SessionDelegate> delegate() const;

    NotificationContext& notification_context() { return *context_; }

    // ---- Transcription ----

    /// Start a run over mono 16 kHz samples.  Returns immediately.
    /// Throws ConcurrencyViolation if a run is still in flight.  Every other
    /// failure arrives through `on_complete`, exactly once.
    void transcribe(std::vector<float> samples, CompletionHandler on_complete);

    /// Same run, resolved through a future.  Do not block on the future from
    /// the thread that pumps this session's notification context.
    std::future<std::vector<Segment>> transcribe(std::vector<float> samples);

    /// Ask the engine to abort at its next cancellation check.  Non-blocking.
    void stop();

    SessionState state() const;
    bool is_busy() const { return busy_.load(); }

private:
    EngineSession(std::unique_ptr<TranscriptionEngine> engine,
                  ParameterSet params,
                  std::shared_ptr<NotificationContext> context);

    /// Called once by the factories, after the shared_ptr exists.
    void wire_callbacks();

    /// Worker thread body.  `self` is handed on to the completion, so the
    /// worker holds no reference once the completion is posted.
    static void run_transcription(std::shared_ptr<EngineSession> self,
                                  const std::vector<float>& samples,
                                  CompletionHandler on_complete);

    static void deliver_completion(std::shared_ptr<EngineSession> self,
                                   std::vector<Segment> segments,
                                   std::exception_ptr error,
                                   CompletionHandler on_complete);

    // ---- CallbackSink ----
    const TranscriptionEngine& callback_engine() const override { return *engine_; }
    bool should_continue() const override { return running_.load(); }
    void handle_progress(float fraction) override;
    void handle_new_segments(std::vector<Segment> segments, int start_index) override;

    static std::exception_ptr validate_samples(const std::vector<float>& samples);

    // ---- Subsystems ----
    std::unique_ptr<TranscriptionEngine>   engine_;
    ParameterSet                           params_;
    CallbackBridge                         bridge_;
    std::shared_ptr<NotificationContext>   context_;

    // ---- State ----
    std::atomic<bool>                      running_{false};  // cancellation flag
    std::atomic<bool>                      busy_{false};     // run in flight
    mutable std::mutex                     mu_;
    std::shared_ptr<SessionDelegate>       delegate_;
    std::thread                            worker_;
};

} // namespace ws
