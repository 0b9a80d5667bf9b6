#include "WhisperTranscriber.hpp"

#include "Logger.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace cs {

namespace {

constexpr int kSampleRate = 16000;
constexpr size_t kMinSamples = kSampleRate / 10;    // 100 ms

} // namespace

WhisperTranscriber::WhisperTranscriber() = default;

bool WhisperTranscriber::load(const std::string& model_path, WhisperSettings settings) {
    return engine_.init(model_path, std::move(settings));
}

TranscriptionResponse WhisperTranscriber::transcribe(const std::string& audio_path) {
    if (!engine_.is_loaded()) {
        throw TranscriptionError(ErrorKind::service_unavailable, "whisper model not loaded");
    }

    std::error_code ec;
    if (!std::filesystem::exists(audio_path, ec)) {
        throw TranscriptionError(ErrorKind::file_error, "no such file: " + audio_path);
    }

    std::vector<float> pcm;
    try {
        pcm = converter_.decode_to_pcm(audio_path, kSampleRate);
    } catch (const std::runtime_error& e) {
        throw TranscriptionError(ErrorKind::invalid_container, e.what());
    }

    if (pcm.size() < kMinSamples) {
        throw TranscriptionError(ErrorKind::audio_quality,
                                 "audio too short (" + std::to_string(pcm.size()) + " samples)");
    }

    WhisperOutput out;
    if (!engine_.transcribe(pcm, out)) {
        throw TranscriptionError(ErrorKind::unknown, "whisper inference failed");
    }

    TranscriptionResponse response;
    response.segments = std::move(out.segments);
    response.duration = out.duration;
    response.language = std::move(out.language);

    CS_LOG_DEBUG("Transcribed " + audio_path + ": " +
                 std::to_string(response.segments.size()) + " segment(s), " +
                 std::to_string(response.duration) + " s");
    return response;
}

} // namespace cs
