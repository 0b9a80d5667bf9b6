#pragma once

#include "Errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cs {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class RecordingStatus {
    recording,
    transcribing,
    complete,
    failed
};

/// Convert status enum to the string stored in SQLite.
inline const char* status_to_string(RecordingStatus s) {
    switch (s) {
        case RecordingStatus::recording:    return "recording";
        case RecordingStatus::transcribing: return "transcribing";
        case RecordingStatus::complete:     return "complete";
        case RecordingStatus::failed:       return "failed";
    }
    return "unknown";
}

/// Parse status string from SQLite back to enum.
inline RecordingStatus status_from_string(const std::string& s) {
    if (s == "recording")    return RecordingStatus::recording;
    if (s == "transcribing") return RecordingStatus::transcribing;
    if (s == "complete")     return RecordingStatus::complete;
    return RecordingStatus::failed;
}

/// How a chunk's container bytes were assembled.
enum class ChunkKind {
    normal,             // chunk 0, or prefixed with the recording's own header
    estimated,          // fallback header strategy; decodability best-effort
    live_placeholder    // every strategy failed; never transcribed
};

inline const char* kind_to_string(ChunkKind k) {
    switch (k) {
        case ChunkKind::normal:           return "normal";
        case ChunkKind::estimated:        return "estimated";
        case ChunkKind::live_placeholder: return "live_placeholder";
    }
    return "unknown";
}

enum class ChunkStatus {
    processing,
    completed,
    failed
};

inline const char* chunk_status_to_string(ChunkStatus s) {
    switch (s) {
        case ChunkStatus::processing: return "processing";
        case ChunkStatus::completed:  return "completed";
        case ChunkStatus::failed:     return "failed";
    }
    return "unknown";
}

inline ChunkStatus chunk_status_from_string(const std::string& s) {
    if (s == "processing") return ChunkStatus::processing;
    if (s == "completed")  return ChunkStatus::completed;
    return ChunkStatus::failed;
}

enum class QueueItemState {
    pending,
    processing,
    completed,
    failed
};

/// Which naming family a watched file belongs to.
enum class ChunkNaming {
    time_range,         // timerange_chunk_NNN.webm
    true_diff,          // truediff_chunk_NNN.webm
    differential,       // differential_chunk_NNN.webm
    live_recording      // recording_*.webm, still being written
};

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// Represents one transcription session over a single recording.
struct RecordingSession {
    std::string     id;             // UUID as string
    int64_t         created_at = 0;     // Unix timestamp (seconds)
    int64_t         completed_at = 0;   // 0 if not yet completed
    RecordingStatus status = RecordingStatus::recording;
    std::string     source_path;    // recording or chunk directory
    int64_t         duration_ms = 0;
    std::string     transcript;     // Final consolidated transcript
};

/// A self-contained, independently decodable slice of a recording.
struct AudioChunk {
    std::string             id;
    int32_t                 sequence_number = 0;
    double                  start_time = 0.0;   // seconds from recording start
    double                  end_time = 0.0;
    std::vector<uint8_t>    audio_data;         // complete WebM bytes
    int                     sample_rate = 48000;
    int                     channels = 1;
    double                  overlap_with_previous = 0.0;
    std::string             source_file_path;   // empty for extracted chunks
    ChunkKind               kind = ChunkKind::normal;

    double duration() const { return end_time - start_time; }
};

/// One recognised span of speech. Times are absolute once they leave the queue.
struct TranscriptionSegment {
    double                  start = 0.0;
    double                  end = 0.0;
    std::string             text;
    std::optional<double>   confidence;
    std::string             speaker;

    double duration() const { return end - start; }
};

/// Outcome of transcribing one chunk.
struct ChunkResult {
    std::string                         chunk_id;
    int32_t                             sequence_number = 0;
    ChunkStatus                         status = ChunkStatus::processing;
    std::vector<TranscriptionSegment>   segments;
    double                              confidence = 0.0;
    int64_t                             processing_time_ms = 0;
    std::string                         error;
    ErrorKind                           error_kind = ErrorKind::none;
    bool                                terminal = false;   // circuit breaker stop
};

/// Queue bookkeeping for one chunk.
struct QueueItem {
    AudioChunk      chunk;
    int             priority = 0;
    int             retry_count = 0;
    int             max_retries = 3;
    int64_t         added_at = 0;       // Unix ms
    int64_t         started_at = 0;
    int64_t         completed_at = 0;
    QueueItemState  state = QueueItemState::pending;
    std::chrono::steady_clock::time_point ready_at{};
    std::string     last_error;
    ErrorKind       last_error_kind = ErrorKind::none;
};

/// A segment held in the realtime text buffer.
struct RealtimeTextSegment {
    int32_t     chunk_sequence = 0;
    std::string chunk_filename;
    int32_t     segment_index = 0;
    double      start = 0.0;
    double      end = 0.0;
    std::string text;
    double      confidence = 0.0;
    int64_t     added_at = 0;       // Unix ms
};

/// A chunk file (or live recording) seen by the watcher.
struct ChunkFileInfo {
    std::string filename;
    std::string full_path;
    int32_t     sequence_number = 0;
    uint64_t    size = 0;
    int64_t     detected_at = 0;    // Unix ms
    bool        is_ready = false;
    ChunkNaming naming = ChunkNaming::time_range;
};

struct QueueStats {
    int     total = 0;
    int     pending = 0;
    int     processing = 0;
    int     completed = 0;
    int     failed = 0;
    double  average_processing_time_ms = 0.0;
    int64_t total_processing_time_ms = 0;
    bool    halted = false;
};

struct WatcherStats {
    int     total_detected = 0;
    int     total_processed = 0;
    int     pending_count = 0;
    bool    is_watching = false;
};

struct ConsolidationStats {
    int     total_chunks = 0;
    int     processed_chunks = 0;
    int     failed_chunks = 0;
    int     total_segments = 0;
    int     merged_segments = 0;    // removed as duplicates
    double  quality_score = 0.0;
    double  coverage_percentage = 0.0;
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Wall clock in Unix milliseconds.
inline int64_t unix_time_ms() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace cs
