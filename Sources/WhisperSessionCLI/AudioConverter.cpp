#include "AudioConverter.hpp"

#include <memory>
#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
}

namespace ws::cli {

namespace {

struct FormatCloser  { void operator()(AVFormatContext* p) const { avformat_close_input(&p); } };
struct CodecFreer    { void operator()(AVCodecContext* p) const { avcodec_free_context(&p); } };
struct SwrFreer      { void operator()(SwrContext* p) const { swr_free(&p); } };
struct PacketFreer   { void operator()(AVPacket* p) const { av_packet_free(&p); } };
struct FrameFreer    { void operator()(AVFrame* p) const { av_frame_free(&p); } };

std::string av_error(int code) {
    char errbuf[256];
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

/// Push one decoded frame (or, with frame == nullptr, the resampler's
/// buffered tail) through swr and append the result.
void convert_into(SwrContext* swr, const AVFrame* frame, int in_rate, int out_rate,
                  std::vector<float>& pcm_out) {
    const int in_samples = frame ? frame->nb_samples : 0;
    const int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, in_rate) + in_samples, out_rate, in_rate, AV_ROUND_UP));
    if (out_samples <= 0) return;

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    const int converted = swr_convert(swr, &out_buf, out_samples,
                                      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
                                      in_samples);
    if (converted > 0) {
        pcm_out.insert(pcm_out.end(), buf.begin(), buf.begin() + converted);
    }
}

} // namespace

AudioConverter::AudioConverter() = default;
AudioConverter::~AudioConverter() = default;

// ---------------------------------------------------------------------------
// decode_file
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::decode_file(const std::string& input_path,
                                               int target_sample_rate) const {
    if (target_sample_rate <= 0) {
        throw std::invalid_argument("target sample rate must be positive");
    }

    // 1. Open input
    AVFormatContext* raw_fmt = nullptr;
    int ret = avformat_open_input(&raw_fmt, input_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw std::runtime_error("failed to open audio file '" + input_path + "': " + av_error(ret));
    }
    std::unique_ptr<AVFormatContext, FormatCloser> fmt(raw_fmt);

    ret = avformat_find_stream_info(fmt.get(), nullptr);
    if (ret < 0) {
        throw std::runtime_error("failed to read stream info from '" + input_path + "': " + av_error(ret));
    }

    // 2. Pick the audio stream
    const int audio_idx = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        throw std::runtime_error("no audio stream in '" + input_path + "'");
    }
    const AVStream* stream = fmt->streams[audio_idx];

    // 3. Open decoder
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        throw std::runtime_error("no decoder for the audio codec in '" + input_path + "'");
    }
    std::unique_ptr<AVCodecContext, CodecFreer> dec(avcodec_alloc_context3(decoder));
    if (!dec) {
        throw std::runtime_error("failed to allocate decoder context");
    }
    avcodec_parameters_to_context(dec.get(), stream->codecpar);
    ret = avcodec_open2(dec.get(), decoder, nullptr);
    if (ret < 0) {
        throw std::runtime_error("failed to open audio decoder: " + av_error(ret));
    }

    // 4. Resampler: anything -> mono float at the target rate
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* raw_swr = nullptr;
    ret = swr_alloc_set_opts2(&raw_swr,
        &out_layout, AV_SAMPLE_FMT_FLT, target_sample_rate,
        &dec->ch_layout, dec->sample_fmt, dec->sample_rate,
        0, nullptr);
    std::unique_ptr<SwrContext, SwrFreer> swr(raw_swr);
    if (ret < 0 || !swr || swr_init(swr.get()) < 0) {
        throw std::runtime_error("failed to initialize audio resampler");
    }

    std::unique_ptr<AVPacket, PacketFreer> pkt(av_packet_alloc());
    std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
    if (!pkt || !frame) {
        throw std::runtime_error("failed to allocate packet/frame");
    }

    std::vector<float> pcm_out;
    const int in_rate = dec->sample_rate;

    // 5. Read, decode, resample
    while (av_read_frame(fmt.get(), pkt.get()) >= 0) {
        if (pkt->stream_index == audio_idx && avcodec_send_packet(dec.get(), pkt.get()) >= 0) {
            while (avcodec_receive_frame(dec.get(), frame.get()) == 0) {
                convert_into(swr.get(), frame.get(), in_rate, target_sample_rate, pcm_out);
            }
        }
        av_packet_unref(pkt.get());
    }

    // 6. Flush decoder, then resampler
    avcodec_send_packet(dec.get(), nullptr);
    while (avcodec_receive_frame(dec.get(), frame.get()) == 0) {
        convert_into(swr.get(), frame.get(), in_rate, target_sample_rate, pcm_out);
    }
    convert_into(swr.get(), nullptr, in_rate, target_sample_rate, pcm_out);

    return pcm_out;
}

} // namespace ws::cli
