#pragma once

#include <string>
#include <vector>

namespace ws::cli {

/// Decodes audio files with FFmpeg's libavformat / libavcodec and converts
/// them with libswresample to the mono float32 PCM whisper.cpp expects.
class AudioConverter {
public:
    AudioConverter();
    ~AudioConverter();

    // Non-copyable.
    AudioConverter(const AudioConverter&) = delete;
    AudioConverter& operator=(const AudioConverter&) = delete;

    /// Decode any container/codec FFmpeg can read (wav, flac, mp3, m4a, ...)
    /// to mono float32 at `target_sample_rate`.
    /// Throws std::runtime_error when the file cannot be decoded.
    std::vector<float> decode_file(const std::string& input_path,
                                   int target_sample_rate) const;
};

} // namespace ws::cli
