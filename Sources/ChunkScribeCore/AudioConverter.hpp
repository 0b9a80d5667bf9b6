#pragma once

#include <string>
#include <vector>

namespace cs {

/// Decodes audio files using FFmpeg's libavformat / libavcodec /
/// libswresample. Primary use-case: turn a WebM/Opus chunk into mono float32
/// PCM at 16 kHz for whisper.cpp inference.
class AudioConverter {
public:
    AudioConverter();
    ~AudioConverter();

    // Non-copyable.
    AudioConverter(const AudioConverter&) = delete;
    AudioConverter& operator=(const AudioConverter&) = delete;

    /// Decode any container FFmpeg understands (WebM, Ogg, M4A, WAV) to
    /// mono float32 PCM at the given sample rate.
    /// Throws std::runtime_error if the file cannot be opened or decoded.
    /// A file that opens but yields no frames returns an empty vector.
    std::vector<float> decode_to_pcm(const std::string& input_path,
                                     int target_sample_rate = 16000) const;
};

} // namespace cs
