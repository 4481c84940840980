#include "AudioConverter.hpp"
#include "CliOptions.hpp"
#include "TranscriptPrinter.hpp"

#include "EngineSession.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

/// Prints segments as they stream in; progress only when verbose.
class ConsoleDelegate : public ws::SessionDelegate {
public:
    explicit ConsoleDelegate(bool verbose) : verbose_(verbose) {}

    void on_progress(ws::EngineSession&, float fraction) override {
        if (verbose_) {
            ws::log::info("progress " + std::to_string(static_cast<int>(fraction * 100.0f)) + "%");
        }
    }

    void on_new_segments(ws::EngineSession&, const std::vector<ws::Segment>& segments, int) override {
        for (const auto& s : segments) {
            std::cout << ws::cli::format_segment(s) << "\n" << std::flush;
        }
    }

    void on_error(ws::EngineSession&, std::exception_ptr error) override {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            ws::log::error(std::string("transcription failed: ") + e.what());
        }
    }

private:
    bool verbose_;
};

ws::ParameterSet make_params(const ws::cli::CliOptions& o) {
    ws::ParameterSet params(o.beam_size ? ws::SamplingStrategy::beam_search
                                        : ws::SamplingStrategy::greedy);
    params.set_language(o.language);
    params.set(&whisper_full_params::translate, o.translate);
    if (o.threads)   params.set(&whisper_full_params::n_threads, *o.threads);
    if (o.max_len)   params.set(&whisper_full_params::max_len, *o.max_len);
    if (o.beam_size) params.set_beam_size(*o.beam_size);
    if (!o.prompt.empty()) params.set_initial_prompt(o.prompt);
    return params;
}

} // namespace

int main(int argc, char** argv) {
    ws::cli::CliOptions opts;
    try {
        opts = ws::cli::parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << ws::cli::usage(argv[0]);
        return 2;
    }
    if (opts.show_help) {
        std::cout << ws::cli::usage(argv[0]);
        return 0;
    }
    if (opts.model_path.empty() || opts.audio_path.empty()) {
        std::cerr << "a model (-m) and an audio file (-f) are required\n\n" << ws::cli::usage(argv[0]);
        return 2;
    }

    ws::log::set_level(opts.verbose ? ws::log::Level::debug : ws::log::Level::warn);

    ws::ParameterSet params;
    try {
        params = make_params(opts);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::vector<float> samples;
    try {
        ws::cli::AudioConverter converter;
        samples = converter.decode_file(opts.audio_path, WHISPER_SAMPLE_RATE);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    ws::log::debug("decoded " + std::to_string(samples.size()) + " samples from " + opts.audio_path);

    auto loop = std::make_shared<ws::MainLoop>();
    std::shared_ptr<ws::EngineSession> session;
    try {
        ws::EngineOptions engine_opts;
        engine_opts.use_gpu = opts.use_gpu;
        session = ws::EngineSession::from_file(opts.model_path, params, engine_opts, loop);
    } catch (const ws::ConstructionError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    session->set_delegate(std::make_shared<ConsoleDelegate>(opts.verbose));

    std::signal(SIGINT, on_sigint);

    bool finished = false;
    bool failed = false;
    std::size_t segment_count = 0;
    session->transcribe(std::move(samples),
                        [&](const std::vector<ws::Segment>& segments, std::exception_ptr error) {
                            finished = true;
                            failed = static_cast<bool>(error);
                            segment_count = segments.size();
                            if (!error) {
                                ws::log::info("transcribed " + std::to_string(segments.size()) + " segments");
                            }
                        });

    bool stop_sent = false;
    while (!finished) {
        loop->run_once(std::chrono::milliseconds(100));
        if (g_interrupted.load() && !stop_sent) {
            std::cerr << "\nstopping...\n";
            session->stop();
            stop_sent = true;
        }
    }

    // The segments themselves were printed as they arrived.
    if (stop_sent && !failed) {
        std::cout << ws::cli::format_stop_summary(segment_count) << "\n" << std::flush;
    }

    return failed ? 1 : 0;
}
