#pragma once

#include "TranscriptionEngine.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ws {

/// Maps onto `whisper_context_params`.
struct EngineOptions {
    bool use_gpu    = true;
    int  gpu_device = 0;
    bool flash_attn = false;
};

/// TranscriptionEngine backed by whisper.cpp's C API.
/// Owns one `whisper_context` for its whole lifetime.
class WhisperCppEngine : public TranscriptionEngine {
public:
    /// Load a ggml model file.  Throws ConstructionError on failure.
    static std::unique_ptr<WhisperCppEngine> from_file(const std::string& model_path,
                                                       const EngineOptions& options = {});

    /// Load a ggml model held in memory.  The buffer is only read during the
    /// call.  Throws ConstructionError on failure.
    static std::unique_ptr<WhisperCppEngine> from_buffer(const std::vector<uint8_t>& model_bytes,
                                                         const EngineOptions& options = {});

    ~WhisperCppEngine() override;

    // Non-copyable.
    WhisperCppEngine(const WhisperCppEngine&) = delete;
    WhisperCppEngine& operator=(const WhisperCppEngine&) = delete;

    int run(const whisper_full_params& params, const float* samples, int n_samples) override;

    int segment_count() const override;
    int64_t segment_t0(int index) const override;
    int64_t segment_t1(int index) const override;
    const char* segment_text(int index) const override;

private:
    explicit WhisperCppEngine(struct whisper_context* ctx);

    struct whisper_context* ctx_ = nullptr;   // opaque whisper.h handle
};

} // namespace ws
