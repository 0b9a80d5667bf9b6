#include "WhisperEngine.hpp"

#include "Logger.hpp"

#include <algorithm>

#include "whisper.h"

namespace cs {

namespace {

constexpr int kWhisperRate = 16000;

/// whisper.cpp reports segment times in 10 ms ticks.
double ticks_to_seconds(int64_t t) {
    return static_cast<double>(t) / 100.0;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperEngine::WhisperEngine() = default;

WhisperEngine::~WhisperEngine() {
    std::lock_guard<std::mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

WhisperEngine::WhisperEngine(WhisperEngine&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mu_);
    ctx_ = other.ctx_;
    settings_ = std::move(other.settings_);
    other.ctx_ = nullptr;
}

WhisperEngine& WhisperEngine::operator=(WhisperEngine&& other) noexcept {
    if (this != &other) {
        std::lock_guard<std::mutex> lk1(mu_);
        std::lock_guard<std::mutex> lk2(other.mu_);
        if (ctx_) {
            whisper_free(ctx_);
        }
        ctx_ = other.ctx_;
        settings_ = std::move(other.settings_);
        other.ctx_ = nullptr;
    }
    return *this;
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

bool WhisperEngine::init(const std::string& model_path, WhisperSettings settings) {
    std::lock_guard<std::mutex> lock(mu_);

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
    settings_ = std::move(settings);

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = settings_.use_gpu;

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        CS_LOG_ERROR("Failed to load whisper model: " + model_path);
        return false;
    }
    CS_LOG_INFO("Loaded whisper model: " + model_path);
    return true;
}

// ---------------------------------------------------------------------------
// is_loaded
// ---------------------------------------------------------------------------

bool WhisperEngine::is_loaded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ctx_ != nullptr;
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

bool WhisperEngine::transcribe(const std::vector<float>& pcm16k, WhisperOutput& out) {
    std::lock_guard<std::mutex> lock(mu_);

    if (!ctx_) {
        return false;
    }

    out = WhisperOutput{};
    out.duration = static_cast<double>(pcm16k.size()) / kWhisperRate;
    if (pcm16k.empty()) {
        return true;
    }

    // Configure whisper parameters
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_progress   = false;
    params.print_timestamps = false;
    params.print_realtime   = false;
    params.print_special    = false;
    params.single_segment   = false;
    params.no_context       = true;    // chunks are independent
    params.language         = settings_.language.c_str();
    params.detect_language  = false;
    params.n_threads        = settings_.threads;

    // Run inference
    int ret = whisper_full(ctx_, params, pcm16k.data(),
                           static_cast<int>(pcm16k.size()));
    if (ret != 0) {
        CS_LOG_ERROR("whisper_full failed with code " + std::to_string(ret));
        return false;
    }

    int lang_id = whisper_full_lang_id(ctx_);
    if (lang_id >= 0) {
        const char* lang = whisper_lang_str(lang_id);
        out.language = lang ? lang : "";
    }

    // Collect segments
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        std::string t = text ? trim(text) : "";
        if (t.empty()) continue;

        TranscriptionSegment seg;
        seg.start = ticks_to_seconds(whisper_full_get_segment_t0(ctx_, i));
        seg.end = ticks_to_seconds(whisper_full_get_segment_t1(ctx_, i));
        seg.text = std::move(t);
        seg.confidence = segment_confidence(i);
        out.segments.push_back(std::move(seg));
    }
    return true;
}

double WhisperEngine::segment_confidence(int segment) const {
    const whisper_token eot = whisper_token_eot(ctx_);
    int n_tokens = whisper_full_n_tokens(ctx_, segment);

    double sum = 0.0;
    int counted = 0;
    for (int j = 0; j < n_tokens; ++j) {
        if (whisper_full_get_token_id(ctx_, segment, j) >= eot) continue;   // special
        sum += whisper_full_get_token_p(ctx_, segment, j);
        ++counted;
    }
    if (counted == 0) {
        return std::max(0.0, 1.0 - whisper_full_get_segment_no_speech_prob(ctx_, segment));
    }
    return sum / counted;
}

} // namespace cs
