#include "WhisperCppEngine.hpp"

#include "Errors.hpp"
#include "Log.hpp"

namespace ws {

namespace {

struct whisper_context_params to_native(const EngineOptions& options) {
    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu    = options.use_gpu;
    cparams.gpu_device = options.gpu_device;
    cparams.flash_attn = options.flash_attn;
    return cparams;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperCppEngine::WhisperCppEngine(struct whisper_context* ctx) : ctx_(ctx) {}

WhisperCppEngine::~WhisperCppEngine() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::unique_ptr<WhisperCppEngine> WhisperCppEngine::from_file(const std::string& model_path,
                                                              const EngineOptions& options) {
    log::route_whisper_logs();

    struct whisper_context* ctx =
        whisper_init_from_file_with_params(model_path.c_str(), to_native(options));
    if (!ctx) {
        throw ConstructionError("failed to load whisper model from '" + model_path + "'");
    }

    log::info("loaded whisper model from " + model_path);
    return std::unique_ptr<WhisperCppEngine>(new WhisperCppEngine(ctx));
}

std::unique_ptr<WhisperCppEngine> WhisperCppEngine::from_buffer(const std::vector<uint8_t>& model_bytes,
                                                                const EngineOptions& options) {
    log::route_whisper_logs();

    if (model_bytes.empty()) {
        throw ConstructionError("model buffer is empty");
    }

    // whisper only reads through this pointer while loading.
    void* buffer = const_cast<uint8_t*>(model_bytes.data());
    struct whisper_context* ctx =
        whisper_init_from_buffer_with_params(buffer, model_bytes.size(), to_native(options));
    if (!ctx) {
        throw ConstructionError("failed to load whisper model from a "
                                + std::to_string(model_bytes.size()) + "-byte buffer");
    }

    log::info("loaded whisper model from memory (" + std::to_string(model_bytes.size()) + " bytes)");
    return std::unique_ptr<WhisperCppEngine>(new WhisperCppEngine(ctx));
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

int WhisperCppEngine::run(const whisper_full_params& params, const float* samples, int n_samples) {
    return whisper_full(ctx_, params, samples, n_samples);
}

// ---------------------------------------------------------------------------
// Segment getters
// ---------------------------------------------------------------------------

int WhisperCppEngine::segment_count() const {
    return whisper_full_n_segments(ctx_);
}

int64_t WhisperCppEngine::segment_t0(int index) const {
    return whisper_full_get_segment_t0(ctx_, index);
}

int64_t WhisperCppEngine::segment_t1(int index) const {
    return whisper_full_get_segment_t1(ctx_, index);
}

const char* WhisperCppEngine::segment_text(int index) const {
    return whisper_full_get_segment_text(ctx_, index);
}

} // namespace ws
