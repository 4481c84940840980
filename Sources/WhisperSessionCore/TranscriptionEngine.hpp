#pragma once

#include <cstdint>

#include "whisper.h"

namespace ws {

/// The opaque inference engine behind an EngineSession.
///
/// run() is synchronous and fires the callbacks installed in `params` on the
/// engine's own threads while it works.  The segment getters read the result
/// of the latest run and are also valid from inside a new-segment callback.
/// Implementations are not reentrant; EngineSession guarantees one run at a
/// time.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    /// Returns 0 on success, engine-specific non-zero on failure or abort.
    virtual int run(const whisper_full_params& params,
                    const float* samples,
                    int n_samples) = 0;

    virtual int segment_count() const = 0;

    /// Timestamps in hundredths of a second.
    virtual int64_t segment_t0(int index) const = 0;
    virtual int64_t segment_t1(int index) const = 0;

    /// May be null.  Not guaranteed to be valid UTF-8.
    virtual const char* segment_text(int index) const = 0;
};

} // namespace ws
