/**
 * test_result_consolidator.cpp - Dedup, alignment, filtering, smoothing, coverage
 */

#include "ResultConsolidator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace cs;

namespace {

TranscriptionSegment seg(double start, double end, const std::string& text,
                         std::optional<double> confidence = 0.9) {
    TranscriptionSegment s;
    s.start = start;
    s.end = end;
    s.text = text;
    s.confidence = confidence;
    return s;
}

ChunkResult completed(const std::string& id, int32_t seq,
                      std::vector<TranscriptionSegment> segments,
                      double confidence = 0.9) {
    ChunkResult r;
    r.chunk_id = id;
    r.sequence_number = seq;
    r.status = ChunkStatus::completed;
    r.segments = std::move(segments);
    r.confidence = confidence;
    return r;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

const std::string kNiHao = "\xE4\xBD\xA0\xE5\xA5\xBD";     // 你好
const std::string kShiJie = "\xE4\xB8\x96\xE7\x95\x8C";    // 世界
const std::string kFullStop = "\xE3\x80\x82";              // 。

} // namespace

void test_overlapping_chunks_keep_better_segment() {
    std::vector<ChunkResult> results = {
        completed("c1", 1, {seg(10.1, 12.4, "hello", 0.7)}),
        completed("c2", 2, {seg(10.0, 12.5, "hello world", 0.95)}),
    };

    ResultConsolidator consolidator;
    ConsolidatedTranscript t = consolidator.consolidate(results, 20.0, "rec.webm", "en");

    assert(t.segments.size() == 1);
    assert(t.segments[0].text == "hello world");
    assert(near(t.segments[0].start, 10.0));
    assert(t.stats.total_segments == 2);
    assert(t.stats.merged_segments == 1);
    assert(t.stats.processed_chunks == 2);
    assert(t.metadata.audio_file == "rec.webm");
    assert(t.metadata.language == "en");
    assert(t.metadata.chunk_count == 2);
    assert(near(t.metadata.duration, 20.0));

    std::cout << "[PASS] test_overlapping_chunks_keep_better_segment" << std::endl;
}

void test_equal_confidence_prefers_longer_text() {
    auto kept = ResultConsolidator::remove_duplicates(
        {seg(0.0, 3.0, "a longer sentence", 0.8), seg(0.2, 3.1, "short", 0.8)}, 0.5);
    assert(kept.size() == 1);
    assert(kept[0].text == "a longer sentence");

    std::cout << "[PASS] test_equal_confidence_prefers_longer_text" << std::endl;
}

void test_dedup_is_idempotent() {
    std::vector<TranscriptionSegment> segs = {
        seg(0.0, 2.0, "one", 0.9),
        seg(1.0, 3.0, "one again", 0.8),
        seg(2.0, 4.0, "two", 0.95),
        seg(2.2, 4.1, "two again", 0.7),
        seg(8.0, 9.0, "three", 0.9),
    };

    auto once = ResultConsolidator::remove_duplicates(segs, 0.5);
    auto twice = ResultConsolidator::remove_duplicates(once, 0.5);
    assert(once.size() == twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        assert(once[i].text == twice[i].text);
    }
    for (size_t i = 0; i + 1 < once.size(); ++i) {
        assert(once[i].start <= once[i + 1].start);
    }

    std::cout << "[PASS] test_dedup_is_idempotent" << std::endl;
}

void test_short_overlap_is_not_duplicate() {
    auto kept = ResultConsolidator::remove_duplicates(
        {seg(0.0, 5.0, "first"), seg(4.8, 9.0, "second")}, 0.5);
    assert(kept.size() == 2);

    std::cout << "[PASS] test_short_overlap_is_not_duplicate" << std::endl;
}

void test_smooth_text() {
    assert(ResultConsolidator::smooth_text("  hello   world , how are you ?  ") ==
           "hello world, how are you?");
    assert(ResultConsolidator::smooth_text(kNiHao + " " + kFullStop + kShiJie) ==
           kNiHao + kFullStop + " " + kShiJie);
    assert(ResultConsolidator::smooth_text(kNiHao + kFullStop) == kNiHao + kFullStop);
    assert(ResultConsolidator::smooth_text("   ").empty());

    std::cout << "[PASS] test_smooth_text" << std::endl;
}

void test_filter_quality() {
    auto kept = ResultConsolidator::filter_quality(
        {
            seg(0.0, 1.0, "confident"),
            seg(1.0, 2.0, "unsure", 0.5),
            seg(2.0, 3.0, "a"),
            seg(3.0, 3.05, "blip"),
            seg(4.0, 5.0, kNiHao),
        },
        0.6);

    assert(kept.size() == 2);
    assert(kept[0].text == "confident");
    assert(kept[1].text == kNiHao);

    std::cout << "[PASS] test_filter_quality" << std::endl;
}

void test_align_times() {
    auto aligned = ResultConsolidator::align_times(
        {seg(0.0, 1.0, "a"), seg(1.3, 2.0, "b"), seg(2.6, 3.0, "c")});

    assert(near(aligned[0].end, 1.15));
    assert(near(aligned[1].start, 1.15));
    // 0.6 s gap is left alone.
    assert(near(aligned[1].end, 2.0));
    assert(near(aligned[2].start, 2.6));

    std::cout << "[PASS] test_align_times" << std::endl;
}

void test_fill_gaps() {
    auto filled = ResultConsolidator::fill_gaps(
        {seg(0.0, 1.0, "a"), seg(5.0, 6.0, "b"), seg(7.0, 8.0, "c")}, 3.0, "[silence]");

    assert(filled.size() == 4);
    assert(filled[1].text == "[silence]");
    assert(near(filled[1].start, 1.0));
    assert(near(filled[1].end, 5.0));
    assert(!filled[1].confidence);

    std::cout << "[PASS] test_fill_gaps" << std::endl;
}

void test_coverage() {
    std::vector<TranscriptionSegment> segs = {seg(0.0, 3.0, "a"), seg(2.0, 5.0, "b")};
    assert(near(ResultConsolidator::coverage(segs, 10.0, "[silence]"), 50.0));

    // Silence never counts.
    segs.push_back(seg(5.0, 10.0, "[silence]", std::nullopt));
    assert(near(ResultConsolidator::coverage(segs, 10.0, "[silence]"), 50.0));

    // Adding speech never lowers coverage.
    double before = ResultConsolidator::coverage(segs, 10.0, "[silence]");
    segs.push_back(seg(7.0, 8.0, "c"));
    double after = ResultConsolidator::coverage(segs, 10.0, "[silence]");
    assert(after >= before);
    assert(near(after, 60.0));

    // Unknown duration falls back to the last segment end.
    assert(near(ResultConsolidator::coverage({seg(0.0, 2.0, "a"), seg(3.0, 4.0, "b")},
                                             0.0, "[silence]"),
                75.0));
    assert(ResultConsolidator::coverage({}, 10.0, "[silence]") == 0.0);

    std::cout << "[PASS] test_coverage" << std::endl;
}

void test_failed_chunks_counted() {
    ChunkResult failed;
    failed.chunk_id = "c2";
    failed.sequence_number = 2;
    failed.status = ChunkStatus::failed;
    failed.error = "[Chunk 3] Transcription failed";

    std::vector<ChunkResult> results = {
        completed("c1", 1, {seg(0.0, 4.0, "first part")}),
        failed,
        completed("c3", 3, {seg(10.0, 14.0, "last part", std::nullopt)}, 0.7),
    };

    ResultConsolidator consolidator;
    ConsolidatedTranscript t = consolidator.consolidate(results);

    assert(t.stats.total_chunks == 3);
    assert(t.stats.processed_chunks == 2);
    assert(t.stats.failed_chunks == 1);

    // The 6 s hole becomes a silence marker.
    assert(t.segments.size() == 3);
    assert(t.segments[1].text == "[silence]");
    assert(t.segments[2].confidence && near(*t.segments[2].confidence, 0.7));
    assert(near(t.stats.quality_score, 0.8));
    assert(near(t.metadata.duration, 14.0));

    std::cout << "[PASS] test_failed_chunks_counted" << std::endl;
}

int main() {
    std::cout << "=== ResultConsolidator Tests ===" << std::endl;

    test_overlapping_chunks_keep_better_segment();
    test_equal_confidence_prefers_longer_text();
    test_dedup_is_idempotent();
    test_short_overlap_is_not_duplicate();
    test_smooth_text();
    test_filter_quality();
    test_align_times();
    test_fill_gaps();
    test_coverage();
    test_failed_chunks_counted();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
