#pragma once

#include <stdexcept>
#include <string>

namespace cs {

/// Failure classes shared by the extractor, the queue and the
/// transcription service.
enum class ErrorKind {
    none,
    insufficient_data,      // not enough bytes yet; retry next tick
    invalid_container,      // bytes are not a usable WebM/EBML stream
    service_unavailable,    // transcription service not running / not loaded
    network_error,
    timeout,
    audio_quality,          // decodes, but nothing usable in it
    file_error,             // temp file or chunk file I/O
    unknown
};

const char* error_kind_to_string(ErrorKind kind);
ErrorKind error_kind_from_string(const std::string& s);

/// Thrown by TranscriptionService implementations.
class TranscriptionError : public std::runtime_error {
public:
    TranscriptionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Best-effort classification of an arbitrary error message.
ErrorKind classify_error(const std::string& message);

/// Whether the queue should schedule another attempt.
bool is_retryable(ErrorKind kind);

/// Errors that count toward the circuit breaker.
bool is_unreachable(ErrorKind kind);

/// Human-readable description of a failure, including `detail` when present.
std::string user_message(ErrorKind kind, const std::string& detail);

} // namespace cs
