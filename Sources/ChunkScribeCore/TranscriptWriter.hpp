#pragma once

#include "Types.hpp"

#include <string>
#include <vector>

namespace cs {

struct TranscriptMetadata {
    std::string audio_file;
    std::string model = "chunk-transcription-v2";
    std::string transcribed_at;         // ISO 8601, UTC
    double      duration = 0.0;         // seconds
    int         segment_count = 0;
    std::string language;
    double      coverage = 0.0;         // percent
    int         chunk_count = 0;
    double      quality_score = 0.0;
};

/// "HH:MM:SS.d"
std::string format_timestamp(double seconds);

/// Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_iso8601(int64_t unix_ms);

/// Metadata block followed by either "[HH:MM:SS.d] text" lines or the
/// segments joined as plain text.
std::string format_transcript(const TranscriptMetadata& metadata,
                              const std::vector<TranscriptionSegment>& segments,
                              bool timestamped);

/// Write `content` to `path` through a temp file and rename, so readers never
/// see a half-written transcript. Creates the parent directory.
bool write_text_file(const std::string& path, const std::string& content);

} // namespace cs
