#pragma once

#include <optional>
#include <string>

namespace ws::cli {

struct CliOptions {
    std::string model_path;                 // -m / --model, or $WHISPER_SESSION_MODEL
    std::string audio_path;                 // -f / --file
    std::string language = "auto";          // -l / --language
    std::optional<int> threads;             // -t / --threads
    std::optional<int> beam_size;           // --beam-size (switches to beam search)
    std::optional<int> max_len;             // --max-len
    std::string prompt;                     // --prompt
    bool translate = false;                 // --translate
    bool use_gpu   = true;                  // --no-gpu
    bool verbose   = false;                 // -v / --verbose
    bool show_help = false;                 // -h / --help
};

/// Parse argv.  Throws std::invalid_argument on unknown flags, missing
/// values or malformed numbers.
CliOptions parse_args(int argc, char** argv);

std::string usage(const std::string& program);

} // namespace ws::cli
