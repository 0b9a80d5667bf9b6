#pragma once

#include "TranscriptWriter.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cs {

struct ConsolidationSettings {
    double      overlap_threshold = 0.5;    // seconds
    double      quality_threshold = 0.6;
    bool        enable_text_smoothing = true;
    bool        enable_time_adjustment = true;
    double      max_gap_fill = 3.0;         // seconds; <= 0 disables
    std::string silence_text = "[silence]";
};

struct ConsolidatedTranscript {
    std::vector<TranscriptionSegment> segments;
    ConsolidationStats                stats;
    TranscriptMetadata                metadata;
};

/// Batch merge of per-chunk results into one transcript:
///
///   collect -> dedup -> align -> filter -> smooth -> fill gaps
class ResultConsolidator {
public:
    explicit ResultConsolidator(ConsolidationSettings settings = {});

    /// Run the whole pipeline. `recording_duration` is the length of the
    /// recording in seconds when known; coverage is measured against it.
    ConsolidatedTranscript consolidate(const std::vector<ChunkResult>& results,
                                       std::optional<double> recording_duration = std::nullopt,
                                       const std::string& audio_file = "",
                                       const std::string& language = "") const;

    const ConsolidationSettings& settings() const { return settings_; }

    // ---- Pipeline stages ----

    /// Segments of completed results in (sequence, index) order, then sorted
    /// by start. Segments without a confidence take their chunk's.
    static std::vector<TranscriptionSegment> collect_segments(
        const std::vector<ChunkResult>& results);

    /// Drop duplicates until none remain. Two segments are duplicates when
    /// they overlap by more than `overlap_threshold` and by more than half of
    /// the shorter one; the higher confidence wins, then the longer text.
    static std::vector<TranscriptionSegment> remove_duplicates(
        std::vector<TranscriptionSegment> segments, double overlap_threshold);

    /// Close gaps shorter than 0.5 s at their midpoint.
    static std::vector<TranscriptionSegment> align_times(
        std::vector<TranscriptionSegment> segments);

    static std::vector<TranscriptionSegment> filter_quality(
        std::vector<TranscriptionSegment> segments, double quality_threshold);

    static std::string smooth_text(const std::string& text);

    static std::vector<TranscriptionSegment> fill_gaps(
        std::vector<TranscriptionSegment> segments, double max_gap,
        const std::string& silence_text);

    /// Percentage of [0, total_duration] covered by speech segments, capped
    /// at 100. A non-positive duration falls back to the last segment end.
    static double coverage(const std::vector<TranscriptionSegment>& segments,
                           double total_duration,
                           const std::string& silence_text);

private:
    ConsolidationSettings settings_;
};

} // namespace cs
