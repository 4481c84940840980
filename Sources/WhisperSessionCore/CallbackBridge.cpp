#include "CallbackBridge.hpp"

#include "Log.hpp"
#include "ParameterSet.hpp"
#include "TextDecoding.hpp"
#include "TranscriptionEngine.hpp"

#include <algorithm>
#include <string>

namespace ws {

namespace {

// ---------------------------------------------------------------------------
// Trampolines (run on whisper's threads)
// ---------------------------------------------------------------------------

void on_new_segment(struct whisper_context* /*ctx*/,
                    struct whisper_state* /*state*/,
                    int n_new,
                    void* user_data) {
    if (!user_data || n_new <= 0) return;
    std::shared_ptr<CallbackSink> sink = CallbackToken::from_opaque(user_data)->acquire();
    if (!sink) return;

    const int total = sink->callback_engine().segment_count();
    const int start = std::max(0, total - n_new);

    std::vector<Segment> batch = CallbackBridge::read_segments(sink->callback_engine(), start, total);
    sink->handle_new_segments(std::move(batch), start);
}

void on_progress(struct whisper_context* /*ctx*/,
                 struct whisper_state* /*state*/,
                 int progress_pct,
                 void* user_data) {
    if (!user_data) return;
    std::shared_ptr<CallbackSink> sink = CallbackToken::from_opaque(user_data)->acquire();
    if (!sink) return;

    const float fraction = std::min(1.0f, std::max(0.0f, static_cast<float>(progress_pct) / 100.0f));
    sink->handle_progress(fraction);
}

bool on_encoder_begin(struct whisper_context* /*ctx*/,
                      struct whisper_state* /*state*/,
                      void* user_data) {
    if (!user_data) return true;
    std::shared_ptr<CallbackSink> sink = CallbackToken::from_opaque(user_data)->acquire();
    if (!sink) return false;   // nobody left to deliver to

    return sink->should_continue();
}

} // namespace

// ---------------------------------------------------------------------------
// wire / unwire
// ---------------------------------------------------------------------------

void CallbackBridge::wire(ParameterSet& params, std::weak_ptr<CallbackSink> sink) {
    auto fresh = std::make_unique<CallbackToken>(std::move(sink));
    void* opaque = fresh->opaque();

    // All three callbacks share one token; they never overlap within a run.
    params.set(&whisper_full_params::new_segment_callback_user_data, opaque);
    params.set(&whisper_full_params::progress_callback_user_data, opaque);
    params.set(&whisper_full_params::encoder_begin_callback_user_data, opaque);

    params.set(&whisper_full_params::new_segment_callback, &on_new_segment);
    params.set(&whisper_full_params::progress_callback, &on_progress);
    params.set(&whisper_full_params::encoder_begin_callback, &on_encoder_begin);

    token_ = std::move(fresh);   // releases the previous token, if any
}

void CallbackBridge::unwire(ParameterSet& params) {
    params.set(&whisper_full_params::new_segment_callback, nullptr);
    params.set(&whisper_full_params::progress_callback, nullptr);
    params.set(&whisper_full_params::encoder_begin_callback, nullptr);

    params.set(&whisper_full_params::new_segment_callback_user_data, nullptr);
    params.set(&whisper_full_params::progress_callback_user_data, nullptr);
    params.set(&whisper_full_params::encoder_begin_callback_user_data, nullptr);

    token_.reset();
}

// ---------------------------------------------------------------------------
// read_segments
// ---------------------------------------------------------------------------

std::vector<Segment> CallbackBridge::read_segments(const TranscriptionEngine& engine, int begin, int end) {
    std::vector<Segment> segments;
    if (end <= begin) {
        return segments;
    }
    segments.reserve(static_cast<size_t>(end - begin));

    for (int i = begin; i < end; ++i) {
        std::optional<std::string> text = decode_native_text(engine.segment_text(i));
        if (!text) {
            log::debug("skipping segment " + std::to_string(i) + ": text is not valid UTF-8");
            continue;
        }
        segments.push_back(Segment{
            engine.segment_t0(i) * kNativeTimeToMs,
            engine.segment_t1(i) * kNativeTimeToMs,
            std::move(*text)});
    }
    return segments;
}

} // namespace ws
