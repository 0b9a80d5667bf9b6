#include "AudioConverter.hpp"

#include <algorithm>
#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

namespace cs {

namespace {

std::string av_error(int code) {
    char errbuf[256];
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

/// Owns every FFmpeg object of one decode pass.
struct DecodeState {
    AVFormatContext* fmt_ctx = nullptr;
    AVCodecContext*  dec_ctx = nullptr;
    SwrContext*      swr = nullptr;
    AVPacket*        pkt = nullptr;
    AVFrame*         frame = nullptr;

    ~DecodeState() {
        if (frame) av_frame_free(&frame);
        if (pkt) av_packet_free(&pkt);
        if (swr) swr_free(&swr);
        if (dec_ctx) avcodec_free_context(&dec_ctx);
        if (fmt_ctx) avformat_close_input(&fmt_ctx);
    }
};

/// Resample one decoded frame (or flush the resampler when frame is null)
/// and append the result.
void append_converted(SwrContext* swr, int in_rate, int out_rate,
                      const AVFrame* frame, std::vector<float>& pcm_out) {
    int in_samples = frame ? frame->nb_samples : 0;
    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, in_rate) + in_samples, out_rate, in_rate, AV_ROUND_UP));
    if (out_samples <= 0) return;

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr, &out_buf, out_samples,
                                frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
                                in_samples);
    if (converted > 0) {
        pcm_out.insert(pcm_out.end(), buf.begin(), buf.begin() + converted);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioConverter::AudioConverter() = default;
AudioConverter::~AudioConverter() = default;

// ---------------------------------------------------------------------------
// decode_to_pcm
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::decode_to_pcm(const std::string& input_path,
                                                 int target_sample_rate) const {
    std::vector<float> pcm_out;
    DecodeState st;

    // 1. Open input file
    int ret = avformat_open_input(&st.fmt_ctx, input_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw std::runtime_error("Failed to open audio file '" + input_path + "': " + av_error(ret));
    }

    ret = avformat_find_stream_info(st.fmt_ctx, nullptr);
    if (ret < 0) {
        throw std::runtime_error("Invalid data in container '" + input_path + "': " + av_error(ret));
    }

    // 2. Find the audio stream
    int audio_idx = av_find_best_stream(st.fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        throw std::runtime_error("No audio stream found in container '" + input_path + "'");
    }
    AVStream* stream = st.fmt_ctx->streams[audio_idx];

    // 3. Open decoder
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        throw std::runtime_error("No decoder found for audio codec in '" + input_path + "'");
    }
    st.dec_ctx = avcodec_alloc_context3(decoder);
    if (!st.dec_ctx) {
        throw std::runtime_error("Failed to allocate decoder context");
    }
    avcodec_parameters_to_context(st.dec_ctx, stream->codecpar);
    ret = avcodec_open2(st.dec_ctx, decoder, nullptr);
    if (ret < 0) {
        throw std::runtime_error("Failed to open audio decoder: " + av_error(ret));
    }

    // 4. Set up resampler (any layout / format -> mono float)
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    ret = swr_alloc_set_opts2(&st.swr,
        &out_layout, AV_SAMPLE_FMT_FLT, target_sample_rate,
        &st.dec_ctx->ch_layout, st.dec_ctx->sample_fmt, st.dec_ctx->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(st.swr) < 0) {
        throw std::runtime_error("Failed to initialize audio resampler");
    }

    const int in_rate = st.dec_ctx->sample_rate;

    // 5. Read packets, decode frames, resample. Corrupt packets at a chunk
    //    boundary are skipped rather than failing the whole chunk.
    st.pkt = av_packet_alloc();
    st.frame = av_frame_alloc();
    if (!st.pkt || !st.frame) {
        throw std::runtime_error("Failed to allocate packet/frame");
    }
    while (av_read_frame(st.fmt_ctx, st.pkt) >= 0) {
        if (st.pkt->stream_index == audio_idx &&
            avcodec_send_packet(st.dec_ctx, st.pkt) >= 0) {
            while (avcodec_receive_frame(st.dec_ctx, st.frame) == 0) {
                append_converted(st.swr, in_rate, target_sample_rate, st.frame, pcm_out);
            }
        }
        av_packet_unref(st.pkt);
    }

    // 6. Flush decoder
    avcodec_send_packet(st.dec_ctx, nullptr);
    while (avcodec_receive_frame(st.dec_ctx, st.frame) == 0) {
        append_converted(st.swr, in_rate, target_sample_rate, st.frame, pcm_out);
    }

    // 7. Flush resampler
    append_converted(st.swr, in_rate, target_sample_rate, nullptr, pcm_out);

    return pcm_out;
}

} // namespace cs
