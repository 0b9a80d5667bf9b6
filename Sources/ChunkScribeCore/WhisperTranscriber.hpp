#pragma once

#include "AudioConverter.hpp"
#include "TranscriptionQueue.hpp"
#include "WhisperEngine.hpp"

#include <string>

namespace cs {

/// Local TranscriptionService: FFmpeg decode to 16 kHz mono, then whisper.cpp.
///
/// Failure mapping:
///   no model loaded        -> service_unavailable
///   chunk file missing     -> file_error
///   decode failure         -> invalid_container
///   under 100 ms of audio  -> audio_quality
///   inference failure      -> unknown (retried)
class WhisperTranscriber : public TranscriptionService {
public:
    WhisperTranscriber();

    /// Load the model. Returns false if it cannot be loaded; transcribe()
    /// then reports service_unavailable.
    bool load(const std::string& model_path, WhisperSettings settings = {});

    bool is_loaded() const { return engine_.is_loaded(); }

    TranscriptionResponse transcribe(const std::string& audio_path) override;

private:
    WhisperEngine  engine_;
    AudioConverter converter_;
};

} // namespace cs
