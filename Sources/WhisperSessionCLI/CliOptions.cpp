#include "CliOptions.hpp"

#include <cstdlib>
#include <stdexcept>

namespace ws::cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    int n = 0;
    try {
        n = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    return n;
}

} // namespace

CliOptions parse_args(int argc, char** argv) {
    CliOptions o;
    if (const char* env = std::getenv("WHISPER_SESSION_MODEL")) {
        o.model_path = env;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string s = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(s + " requires a value");
            }
            return argv[++i];
        };

        if      (s == "-h" || s == "--help")     o.show_help = true;
        else if (s == "-v" || s == "--verbose")  o.verbose = true;
        else if (s == "--translate")             o.translate = true;
        else if (s == "--no-gpu")                o.use_gpu = false;
        else if (s == "-m" || s == "--model")    o.model_path = value();
        else if (s == "-f" || s == "--file")     o.audio_path = value();
        else if (s == "-l" || s == "--language") o.language = value();
        else if (s == "--prompt")                o.prompt = value();
        else if (s == "-t" || s == "--threads")  o.threads = parse_int(s, value());
        else if (s == "--beam-size")             o.beam_size = parse_int(s, value());
        else if (s == "--max-len")               o.max_len = parse_int(s, value());
        else if (!s.empty() && s[0] != '-' && o.audio_path.empty()) o.audio_path = s;
        else throw std::invalid_argument("unknown argument: " + s);
    }

    if (o.threads && *o.threads < 1) {
        throw std::invalid_argument("--threads must be at least 1");
    }
    if (o.beam_size && *o.beam_size < 1) {
        throw std::invalid_argument("--beam-size must be at least 1");
    }
    if (o.max_len && *o.max_len < 0) {
        throw std::invalid_argument("--max-len must not be negative");
    }
    return o;
}

std::string usage(const std::string& program) {
    return "usage: " + program + " [options] -f <audio file>\n"
           "\n"
           "  -m, --model <path>     ggml model (default: $WHISPER_SESSION_MODEL)\n"
           "  -f, --file <path>      audio file, any format FFmpeg can decode\n"
           "  -l, --language <code>  language code or 'auto' (default: auto)\n"
           "  -t, --threads <n>      inference threads\n"
           "      --beam-size <n>    use beam search with n beams\n"
           "      --max-len <n>      max segment length in characters (0 = unlimited)\n"
           "      --prompt <text>    initial prompt\n"
           "      --translate        translate to English\n"
           "      --no-gpu           run on the CPU only\n"
           "  -v, --verbose          progress and engine logs\n"
           "  -h, --help             show this help\n";
}

} // namespace ws::cli
