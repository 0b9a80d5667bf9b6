#include "Errors.hpp"

#include <algorithm>
#include <cctype>

namespace cs {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::none:                return "none";
        case ErrorKind::insufficient_data:   return "insufficient_data";
        case ErrorKind::invalid_container:   return "invalid_container";
        case ErrorKind::service_unavailable: return "service_unavailable";
        case ErrorKind::network_error:       return "network_error";
        case ErrorKind::timeout:             return "timeout";
        case ErrorKind::audio_quality:       return "audio_quality";
        case ErrorKind::file_error:          return "file_error";
        case ErrorKind::unknown:             return "unknown";
    }
    return "unknown";
}

ErrorKind error_kind_from_string(const std::string& s) {
    if (s == "none")                return ErrorKind::none;
    if (s == "insufficient_data")   return ErrorKind::insufficient_data;
    if (s == "invalid_container")   return ErrorKind::invalid_container;
    if (s == "service_unavailable") return ErrorKind::service_unavailable;
    if (s == "network_error")       return ErrorKind::network_error;
    if (s == "timeout")             return ErrorKind::timeout;
    if (s == "audio_quality")       return ErrorKind::audio_quality;
    if (s == "file_error")          return ErrorKind::file_error;
    return ErrorKind::unknown;
}

// ---------------------------------------------------------------------------
// classify_error
// ---------------------------------------------------------------------------

ErrorKind classify_error(const std::string& message) {
    std::string m = message;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains(m, "connection refused") || contains(m, "econnrefused") ||
        contains(m, "not running") || contains(m, "unavailable") ||
        contains(m, "model not loaded")) {
        return ErrorKind::service_unavailable;
    }
    if (contains(m, "timed out") || contains(m, "timeout")) {
        return ErrorKind::timeout;
    }
    if (contains(m, "network") || contains(m, "connection reset") ||
        contains(m, "socket")) {
        return ErrorKind::network_error;
    }
    if (contains(m, "no such file") || contains(m, "permission denied") ||
        contains(m, "failed to write") || contains(m, "failed to open")) {
        return ErrorKind::file_error;
    }
    if (contains(m, "no speech") || contains(m, "silent") ||
        contains(m, "too short") || contains(m, "no audio")) {
        return ErrorKind::audio_quality;
    }
    if (contains(m, "ebml") || contains(m, "invalid data") ||
        contains(m, "container")) {
        return ErrorKind::invalid_container;
    }
    return ErrorKind::unknown;
}

bool is_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::audio_quality:
        case ErrorKind::file_error:
        case ErrorKind::invalid_container:
        case ErrorKind::none:
            return false;
        default:
            return true;
    }
}

bool is_unreachable(ErrorKind kind) {
    return kind == ErrorKind::service_unavailable ||
           kind == ErrorKind::network_error ||
           kind == ErrorKind::timeout;
}

// ---------------------------------------------------------------------------
// user_message
// ---------------------------------------------------------------------------

std::string user_message(ErrorKind kind, const std::string& detail) {
    std::string text;
    switch (kind) {
        case ErrorKind::service_unavailable:
            text = "Transcription service is unavailable. Check that the model is installed and the service is running";
            break;
        case ErrorKind::network_error:
            text = "Network error while contacting the transcription service";
            break;
        case ErrorKind::timeout:
            text = "Transcription request timed out";
            break;
        case ErrorKind::audio_quality:
            text = "Audio could not be recognised (silent or too short)";
            break;
        case ErrorKind::file_error:
            text = "Chunk file could not be read or written";
            break;
        case ErrorKind::invalid_container:
            text = "Chunk is not a valid WebM stream";
            break;
        case ErrorKind::insufficient_data:
            text = "Not enough audio data yet";
            break;
        case ErrorKind::none:
        case ErrorKind::unknown:
            text = "Transcription failed";
            break;
    }
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

} // namespace cs
