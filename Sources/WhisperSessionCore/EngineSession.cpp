#include "EngineSession.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <climits>
#include <cmath>
#include <system_error>

namespace ws {

namespace {

// Keeps a throwing delegate from starving the completion handler.
template <typename Fn>
void notify_delegate(const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        log::error(std::string("delegate ") + what + " threw: " + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

EngineSession::EngineSession(std::unique_ptr<TranscriptionEngine> engine,
                             ParameterSet params,
                             std::shared_ptr<NotificationContext> context)
    : engine_(std::move(engine)),
      params_(std::move(params)),
      context_(std::move(context)) {}

EngineSession::~EngineSession() {
    running_.store(false);
    bridge_.unwire(params_);

    if (worker_.joinable()) {
        // The worker may hold the last reference and destroy us itself.
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

std::shared_ptr<EngineSession> EngineSession::from_file(const std::string& model_path,
                                                        ParameterSet params,
                                                        const EngineOptions& options,
                                                        std::shared_ptr<NotificationContext> context) {
    return with_engine(WhisperCppEngine::from_file(model_path, options),
                       std::move(params), std::move(context));
}

std::shared_ptr<EngineSession> EngineSession::from_buffer(const std::vector<uint8_t>& model_bytes,
                                                          ParameterSet params,
                                                          const EngineOptions& options,
                                                          std::shared_ptr<NotificationContext> context) {
    return with_engine(WhisperCppEngine::from_buffer(model_bytes, options),
                       std::move(params), std::move(context));
}

std::shared_ptr<EngineSession> EngineSession::with_engine(std::unique_ptr<TranscriptionEngine> engine,
                                                          ParameterSet params,
                                                          std::shared_ptr<NotificationContext> context) {
    if (!engine) {
        throw ConstructionError("engine is null");
    }
    if (!context) {
        context = std::make_shared<SerialQueue>();
    }

    std::shared_ptr<EngineSession> session(
        new EngineSession(std::move(engine), std::move(params), std::move(context)));
    session->wire_callbacks();
    return session;
}

void EngineSession::wire_callbacks() {
    bridge_.wire(params_, std::weak_ptr<CallbackSink>(shared_from_this()));
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void EngineSession::set_params(const ParameterSet& params) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        throw ConcurrencyViolation("set_params() called while a run is in flight");
    }

    try {
        params_ = params;
        wire_callbacks();
    } catch (...) {
        busy_.store(false);
        throw;
    }
    busy_.store(false);
}

void EngineSession::set_delegate(std::shared_ptr<SessionDelegate> delegate) {
    std::lock_guard<std::mutex> lock(mu_);
    delegate_ = std::move(delegate);
}

std::shared_ptr<SessionDelegate> EngineSession::delegate() const {
    std::lock_guard<std::mutex> lock(mu_);
    return delegate_;
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

void EngineSession::transcribe(std::vector<float> samples, CompletionHandler on_complete) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        throw ConcurrencyViolation("transcribe() called while a run is in flight");
    }

    if (std::exception_ptr invalid = validate_samples(samples)) {
        log::warn("rejecting transcription input");
        deliver_completion(shared_from_this(), {}, invalid, std::move(on_complete));
        return;
    }

    // The previous worker has already posted its completion; it is at most
    // unwinding.
    if (worker_.joinable()) {
        worker_.join();
    }

    running_.store(true);
    std::shared_ptr<EngineSession> self = shared_from_this();

    try {
        worker_ = std::thread(
            [self, samples = std::move(samples), on_complete = std::move(on_complete)]() mutable {
                run_transcription(std::move(self), samples, std::move(on_complete));
            });
    } catch (const std::system_error&) {
        running_.store(false);
        busy_.store(false);
        throw;
    }
}

std::future<std::vector<Segment>> EngineSession::transcribe(std::vector<float> samples) {
    auto promise = std::make_shared<std::promise<std::vector<Segment>>>();
    std::future<std::vector<Segment>> future = promise->get_future();

    transcribe(std::move(samples),
               [promise](const std::vector<Segment>& segments, std::exception_ptr error) {
                   if (error) {
                       promise->set_exception(error);
                   } else {
                       promise->set_value(segments);
                   }
               });
    return future;
}

void EngineSession::stop() {
    if (running_.exchange(false)) {
        log::debug("stop requested");
    }
}

SessionState EngineSession::state() const {
    if (!busy_.load()) {
        return SessionState::idle;
    }
    return running_.load() ? SessionState::running : SessionState::stopping;
}

// ---------------------------------------------------------------------------
// run_transcription  (runs on the worker thread)
// ---------------------------------------------------------------------------

void EngineSession::run_transcription(std::shared_ptr<EngineSession> self,
                                      const std::vector<float>& samples,
                                      CompletionHandler on_complete) {
    TranscriptionEngine& engine = *self->engine_;
    log::debug("transcribing " + std::to_string(samples.size()) + " samples on "
               + std::to_string(self->params_.get(&whisper_full_params::n_threads)) + " threads");

    int rc = 0;
    std::exception_ptr error;
    try {
        rc = engine.run(self->params_.native(), samples.data(), static_cast<int>(samples.size()));
    } catch (const std::exception& e) {
        log::error(std::string("engine run threw: ") + e.what());
        error = std::current_exception();
    }

    const bool stop_requested = !self->running_.exchange(false);

    std::vector<Segment> segments;
    if (!error) {
        segments = CallbackBridge::read_segments(engine, 0, engine.segment_count());

        if (rc != 0 && stop_requested) {
            log::info("run stopped early (code " + std::to_string(rc) + ") with "
                      + std::to_string(segments.size()) + " segments");
        } else if (rc != 0) {
            log::error("engine run failed with code " + std::to_string(rc));
            error = std::make_exception_ptr(
                EngineRunError("engine run failed with code " + std::to_string(rc), rc));
            segments.clear();
        } else {
            log::debug("run finished with " + std::to_string(segments.size()) + " segments");
        }
    }

    deliver_completion(std::move(self), std::move(segments), error, std::move(on_complete));
}

void EngineSession::deliver_completion(std::shared_ptr<EngineSession> self,
                                       std::vector<Segment> segments,
                                       std::exception_ptr error,
                                       CompletionHandler on_complete) {
    // Held locally: the closure may run, and drop the session, before post()
    // returns.
    std::shared_ptr<NotificationContext> context = self->context_;
    context->post([self = std::move(self), segments = std::move(segments), error, on_complete = std::move(on_complete)]() {
        // Cleared first so the handler may start the next run.
        self->busy_.store(false);

        std::shared_ptr<SessionDelegate> delegate = self->delegate();
        if (error) {
            if (delegate) {
                notify_delegate("on_error", [&] { delegate->on_error(*self, error); });
            }
            if (on_complete) on_complete({}, error);
        } else {
            if (delegate) {
                notify_delegate("on_complete", [&] { delegate->on_complete(*self, segments); });
            }
            if (on_complete) on_complete(segments, nullptr);
        }
    });
}

// ---------------------------------------------------------------------------
// CallbackSink  (runs on the engine's threads)
// ---------------------------------------------------------------------------

void EngineSession::handle_progress(float fraction) {
    std::shared_ptr<EngineSession> self = shared_from_this();
    context_->post([self, fraction]() {
        if (std::shared_ptr<SessionDelegate> delegate = self->delegate()) {
            delegate->on_progress(*self, fraction);
        }
    });
}

void EngineSession::handle_new_segments(std::vector<Segment> segments, int start_index) {
    std::shared_ptr<EngineSession> self = shared_from_this();
    context_->post([self, segments = std::move(segments), start_index]() {
        if (std::shared_ptr<SessionDelegate> delegate = self->delegate()) {
            delegate->on_new_segments(*self, segments, start_index);
        }
    });
}

// ---------------------------------------------------------------------------
// validate_samples
// ---------------------------------------------------------------------------

std::exception_ptr EngineSession::validate_samples(const std::vector<float>& samples) {
    if (samples.empty()) {
        return std::make_exception_ptr(InvalidInputError("no audio samples"));
    }
    if (samples.size() > static_cast<size_t>(INT_MAX)) {
        return std::make_exception_ptr(InvalidInputError(
            "too many samples for one run: " + std::to_string(samples.size())));
    }
    for (size_t i = 0; i < samples.size(); ++i) {
        if (!std::isfinite(samples[i])) {
            return std::make_exception_ptr(InvalidInputError(
                "sample " + std::to_string(i) + " is not a finite number"));
        }
    }
    return nullptr;
}

} // namespace ws
