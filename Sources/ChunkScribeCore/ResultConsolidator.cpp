#include "ResultConsolidator.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

namespace cs {

namespace {

constexpr double kAlignGap = 0.5;
constexpr double kMinSegmentDuration = 0.1;
constexpr size_t kMinTextChars = 2;

// Full-width sentence enders and commas, UTF-8 encoded.
const char* const kCjkPunctuation[] = {
    "\xE3\x80\x82",     // 。
    "\xEF\xBC\x8E",     // ．
    "\xEF\xBC\x81",     // ！
    "\xEF\xBC\x9F",     // ？
    "\xE3\x80\x81",     // 、
    "\xEF\xBC\x8C",     // ，
};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_ascii_punct(char c) {
    return c == ',' || c == '.' || c == '!' || c == '?' || c == ';' || c == ':';
}

/// Number of UTF-8 code points.
size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && is_space(s[b])) ++b;
    size_t e = s.size();
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

void strip_trailing_spaces(std::string& s) {
    while (!s.empty() && s.back() == ' ') s.pop_back();
}

double confidence_of(const TranscriptionSegment& s) {
    return s.confidence.value_or(0.0);
}

bool is_duplicate(const TranscriptionSegment& a, const TranscriptionSegment& b,
                  double threshold) {
    double overlap = std::min(a.end, b.end) - std::max(a.start, b.start);
    double shorter = std::min(a.duration(), b.duration());
    return overlap > threshold && overlap > 0.5 * shorter;
}

/// True if `candidate` should replace `current`.
bool is_better(const TranscriptionSegment& candidate, const TranscriptionSegment& current) {
    double c = confidence_of(candidate);
    double k = confidence_of(current);
    if (std::fabs(c - k) > 1e-9) return c > k;
    return utf8_length(candidate.text) > utf8_length(current.text);
}

void sort_by_start(std::vector<TranscriptionSegment>& segments) {
    std::stable_sort(segments.begin(), segments.end(),
                     [](const TranscriptionSegment& a, const TranscriptionSegment& b) {
                         return a.start < b.start;
                     });
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ResultConsolidator::ResultConsolidator(ConsolidationSettings settings)
    : settings_(std::move(settings)) {}

// ---------------------------------------------------------------------------
// consolidate
// ---------------------------------------------------------------------------

ConsolidatedTranscript ResultConsolidator::consolidate(
    const std::vector<ChunkResult>& results,
    std::optional<double> recording_duration,
    const std::string& audio_file,
    const std::string& language) const {
    ConsolidatedTranscript out;
    ConsolidationStats& stats = out.stats;

    stats.total_chunks = static_cast<int>(results.size());
    for (const auto& r : results) {
        if (r.status == ChunkStatus::completed) ++stats.processed_chunks;
        if (r.status == ChunkStatus::failed) ++stats.failed_chunks;
    }

    std::vector<TranscriptionSegment> segs = collect_segments(results);
    stats.total_segments = static_cast<int>(segs.size());

    segs = remove_duplicates(std::move(segs), settings_.overlap_threshold);
    stats.merged_segments = stats.total_segments - static_cast<int>(segs.size());

    if (settings_.enable_time_adjustment) {
        segs = align_times(std::move(segs));
    }

    segs = filter_quality(std::move(segs), settings_.quality_threshold);

    if (settings_.enable_text_smoothing) {
        for (auto& s : segs) s.text = smooth_text(s.text);
        segs.erase(std::remove_if(segs.begin(), segs.end(),
                                  [](const TranscriptionSegment& s) { return s.text.empty(); }),
                   segs.end());
    }

    if (settings_.max_gap_fill > 0) {
        segs = fill_gaps(std::move(segs), settings_.max_gap_fill, settings_.silence_text);
    }

    double confidence_sum = 0.0;
    int speech = 0;
    double last_end = 0.0;
    for (const auto& s : segs) {
        last_end = std::max(last_end, s.end);
        if (s.text == settings_.silence_text) continue;
        confidence_sum += confidence_of(s);
        ++speech;
    }
    stats.quality_score = speech > 0 ? confidence_sum / speech : 0.0;

    double total = recording_duration.value_or(0.0);
    stats.coverage_percentage = coverage(segs, total, settings_.silence_text);

    TranscriptMetadata& md = out.metadata;
    md.audio_file = audio_file;
    md.transcribed_at = format_iso8601(unix_time_ms());
    md.duration = total > 0 ? total : last_end;
    md.segment_count = static_cast<int>(segs.size());
    md.language = language;
    md.coverage = stats.coverage_percentage;
    md.chunk_count = stats.total_chunks;
    md.quality_score = stats.quality_score;

    CS_LOG_INFO("Consolidated " + std::to_string(stats.total_segments) + " segment(s) from " +
                std::to_string(stats.processed_chunks) + " chunk(s): " +
                std::to_string(stats.merged_segments) + " duplicate(s) removed, " +
                std::to_string(md.segment_count) + " kept");

    out.segments = std::move(segs);
    return out;
}

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

std::vector<TranscriptionSegment> ResultConsolidator::collect_segments(
    const std::vector<ChunkResult>& results) {
    std::vector<const ChunkResult*> completed;
    for (const auto& r : results) {
        if (r.status == ChunkStatus::completed) completed.push_back(&r);
    }
    std::stable_sort(completed.begin(), completed.end(),
                     [](const ChunkResult* a, const ChunkResult* b) {
                         return a->sequence_number < b->sequence_number;
                     });

    std::vector<TranscriptionSegment> segs;
    for (const ChunkResult* r : completed) {
        for (auto seg : r->segments) {
            if (!seg.confidence) seg.confidence = r->confidence;
            segs.push_back(std::move(seg));
        }
    }
    sort_by_start(segs);
    return segs;
}

std::vector<TranscriptionSegment> ResultConsolidator::remove_duplicates(
    std::vector<TranscriptionSegment> segments, double overlap_threshold) {
    sort_by_start(segments);

    while (true) {
        std::vector<TranscriptionSegment> kept;
        kept.reserve(segments.size());

        for (auto& seg : segments) {
            bool merged = false;
            for (auto& k : kept) {
                if (!is_duplicate(k, seg, overlap_threshold)) continue;
                if (is_better(seg, k)) k = seg;
                merged = true;
                break;
            }
            if (!merged) kept.push_back(std::move(seg));
        }
        sort_by_start(kept);

        if (kept.size() == segments.size()) return kept;
        segments = std::move(kept);
    }
}

std::vector<TranscriptionSegment> ResultConsolidator::align_times(
    std::vector<TranscriptionSegment> segments) {
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        auto& cur = segments[i];
        auto& next = segments[i + 1];
        double gap = next.start - cur.end;
        if (gap > 0 && gap < kAlignGap) {
            double mid = (cur.end + next.start) / 2.0;
            cur.end = mid;
            next.start = mid;
        }
    }
    return segments;
}

std::vector<TranscriptionSegment> ResultConsolidator::filter_quality(
    std::vector<TranscriptionSegment> segments, double quality_threshold) {
    segments.erase(
        std::remove_if(segments.begin(), segments.end(),
                       [quality_threshold](const TranscriptionSegment& s) {
                           return confidence_of(s) < quality_threshold ||
                                  utf8_length(trim(s.text)) < kMinTextChars ||
                                  s.duration() < kMinSegmentDuration;
                       }),
        segments.end());
    return segments;
}

std::string ResultConsolidator::smooth_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (is_space(c)) {
            if (!out.empty() && out.back() != ' ') out += ' ';
            while (i < text.size() && is_space(text[i])) ++i;
            continue;
        }

        const char* cjk = nullptr;
        for (const char* p : kCjkPunctuation) {
            if (text.compare(i, std::strlen(p), p) == 0) {
                cjk = p;
                break;
            }
        }
        if (cjk) {
            strip_trailing_spaces(out);
            out += cjk;
            i += std::strlen(cjk);
            while (i < text.size() && is_space(text[i])) ++i;
            if (i < text.size()) out += ' ';
            continue;
        }

        if (is_ascii_punct(c)) {
            strip_trailing_spaces(out);
        }
        out += c;
        ++i;
    }
    return trim(out);
}

std::vector<TranscriptionSegment> ResultConsolidator::fill_gaps(
    std::vector<TranscriptionSegment> segments, double max_gap,
    const std::string& silence_text) {
    std::vector<TranscriptionSegment> out;
    out.reserve(segments.size());

    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            double prev_end = out.back().end;
            if (segments[i].start - prev_end > max_gap) {
                TranscriptionSegment silence;
                silence.start = prev_end;
                silence.end = segments[i].start;
                silence.text = silence_text;
                out.push_back(std::move(silence));
            }
        }
        out.push_back(std::move(segments[i]));
    }
    return out;
}

double ResultConsolidator::coverage(const std::vector<TranscriptionSegment>& segments,
                                    double total_duration,
                                    const std::string& silence_text) {
    std::vector<std::pair<double, double>> spans;
    double last_end = 0.0;
    for (const auto& s : segments) {
        if (s.text == silence_text || s.end <= s.start) continue;
        spans.emplace_back(s.start, s.end);
        last_end = std::max(last_end, s.end);
    }

    double total = total_duration > 0 ? total_duration : last_end;
    if (total <= 0 || spans.empty()) return 0.0;

    std::sort(spans.begin(), spans.end());
    double covered = 0.0;
    double cur_start = spans[0].first;
    double cur_end = spans[0].second;
    auto flush = [&](double a, double b) {
        a = std::max(a, 0.0);
        b = std::min(b, total);
        if (b > a) covered += b - a;
    };
    for (size_t i = 1; i < spans.size(); ++i) {
        if (spans[i].first <= cur_end) {
            cur_end = std::max(cur_end, spans[i].second);
        } else {
            flush(cur_start, cur_end);
            cur_start = spans[i].first;
            cur_end = spans[i].second;
        }
    }
    flush(cur_start, cur_end);

    return std::min(100.0, covered / total * 100.0);
}

} // namespace cs
