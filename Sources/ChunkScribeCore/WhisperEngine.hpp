#pragma once

#include "Types.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cs {

struct WhisperSettings {
    std::string language = "auto";     // "auto" detects per call
    int         threads = 4;
    bool        use_gpu = true;
};

/// Segments of one inference pass, times relative to the start of the audio.
struct WhisperOutput {
    std::vector<TranscriptionSegment> segments;
    std::string language;
    double      duration = 0.0;       // seconds of audio fed to the model
};

/// Thin wrapper around whisper.cpp's C API.
/// Loads a ggml model once, then transcribes PCM audio buffers on demand.
class WhisperEngine {
public:
    WhisperEngine();
    ~WhisperEngine();

    // Non-copyable, movable.
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;
    WhisperEngine(WhisperEngine&&) noexcept;
    WhisperEngine& operator=(WhisperEngine&&) noexcept;

    /// Load the ggml model file (e.g. "ggml-base.en.bin").
    /// Returns true on success.  Thread-safe.
    bool init(const std::string& model_path, WhisperSettings settings = {});

    /// Transcribe mono float32 PCM sampled at 16 kHz.
    /// @param out  Filled with timed segments on success.
    /// @return  false if no model is loaded or inference failed.
    bool transcribe(const std::vector<float>& pcm16k, WhisperOutput& out);

    /// Whether a model has been successfully loaded.
    bool is_loaded() const;

private:
    /// Mean probability of the segment's text tokens.
    double segment_confidence(int segment) const;

    struct whisper_context* ctx_ = nullptr;   // opaque whisper.h handle
    WhisperSettings         settings_;
    mutable std::mutex      mu_;
};

} // namespace cs
