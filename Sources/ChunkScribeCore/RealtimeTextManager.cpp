#include "RealtimeTextManager.hpp"

#include "Logger.hpp"
#include "TranscriptWriter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <map>
#include <sstream>
#include <utility>

namespace cs {

namespace {

const std::string kTimeRangePrefix = "timerange_chunk_";
const std::string kIdeographicFullStop = "\xE3\x80\x82";   // 。

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool by_chunk_then_index(const RealtimeTextSegment& a, const RealtimeTextSegment& b) {
    if (a.chunk_sequence != b.chunk_sequence) return a.chunk_sequence < b.chunk_sequence;
    return a.segment_index < b.segment_index;
}

} // namespace

const char* realtime_status_to_string(RealtimeStatus s) {
    switch (s) {
        case RealtimeStatus::idle:         return "idle";
        case RealtimeStatus::transcribing: return "transcribing";
        case RealtimeStatus::completed:    return "completed";
        case RealtimeStatus::error:        return "error";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

RealtimeTextManager::RealtimeTextManager(RealtimeTextConfig config)
    : config_(std::move(config)) {}

RealtimeTextManager::~RealtimeTextManager() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        running_ = false;
    }
    cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
}

void RealtimeTextManager::add_observer(TextUpdateObserver* observer) {
    std::lock_guard<std::mutex> lock(mu_);
    if (observer) observers_.push_back(observer);
}

std::string RealtimeTextManager::output_path_for(const std::string& path) {
    std::filesystem::path p(path);
    p.replace_extension(".rt.txt");
    return p.string();
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

void RealtimeTextManager::start(const std::string& output_path) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (running_) return;

        output_path_ = output_path;
        buffer_.clear();
        processed_sequences_.clear();
        metadata_ = RealtimeMetadata{};
        metadata_.status = RealtimeStatus::transcribing;
        metadata_.start_time = unix_time_ms();
        metadata_.last_update_time = metadata_.start_time;
        modified_ = false;
        write_errors_ = 0;

        if (config_.enable_auto_save) {
            running_ = true;
        }
    }
    if (timer_.joinable()) {
        timer_.join();
    }
    if (config_.enable_auto_save) {
        timer_ = std::thread(&RealtimeTextManager::run_autosave, this);
    }
    CS_LOG_INFO("Realtime transcript: " + output_path);
}

void RealtimeTextManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        running_ = false;
    }
    cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (metadata_.status != RealtimeStatus::error) {
            metadata_.status = RealtimeStatus::completed;
        }
        metadata_.estimated_duration_ms = 0;
        if (!output_path_.empty() && (modified_ || !buffer_.empty())) {
            write_locked();
        }
    }
    notify();
}

void RealtimeTextManager::run_autosave() {
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
        cv_.wait_for(lock, std::chrono::milliseconds(config_.write_interval_ms),
                     [this] { return !running_; });
        if (!running_) break;

        if (modified_) {
            write_locked();
        }
        if (write_errors_ >= config_.max_write_errors) {
            CS_LOG_ERROR("Too many write errors; realtime autosave stopped");
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// add_result
// ---------------------------------------------------------------------------

void RealtimeTextManager::add_result(const ChunkResult& result,
                                     const std::string& chunk_filename) {
    if (result.status != ChunkStatus::completed) return;

    {
        std::lock_guard<std::mutex> lock(mu_);
        const int64_t now = unix_time_ms();
        const int32_t seq = result.sequence_number;

        auto make = [&](const TranscriptionSegment& s, int32_t index) {
            RealtimeTextSegment r;
            r.chunk_sequence = seq;
            r.chunk_filename = chunk_filename;
            r.segment_index = index;
            r.start = s.start;
            r.end = s.end;
            r.text = s.text;
            r.confidence = s.confidence.value_or(result.confidence);
            r.added_at = now;
            return r;
        };

        if (chunk_filename.compare(0, kTimeRangePrefix.size(), kTimeRangePrefix) == 0) {
            // timerange_chunk_N covers [(N-1)*interval, N*interval)
            const double interval = config_.chunk_interval_seconds;
            const double lo = std::max(0, seq - 1) * interval;
            const double hi = std::max(1, seq) * interval;
            auto in_range = [lo, hi](double start) { return start >= lo && start < hi; };

            std::vector<RealtimeTextSegment> fresh;
            for (const auto& s : result.segments) {
                if (in_range(s.start)) {
                    fresh.push_back(make(s, static_cast<int32_t>(fresh.size())));
                }
            }
            if (fresh.empty()) return;

            buffer_.erase(std::remove_if(buffer_.begin(), buffer_.end(),
                                         [&](const RealtimeTextSegment& r) { return in_range(r.start); }),
                          buffer_.end());
            buffer_.insert(buffer_.end(), fresh.begin(), fresh.end());
        } else {
            buffer_.erase(std::remove_if(buffer_.begin(), buffer_.end(),
                                         [seq](const RealtimeTextSegment& r) { return r.chunk_sequence == seq; }),
                          buffer_.end());
            int32_t index = 0;
            for (const auto& s : result.segments) {
                buffer_.push_back(make(s, index++));
            }
        }

        std::stable_sort(buffer_.begin(), buffer_.end(), by_chunk_then_index);

        if (buffer_.size() > config_.buffer_size) {
            size_t excess = buffer_.size() - config_.buffer_size;
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(excess));
            CS_LOG_DEBUG("Realtime buffer full; evicted " + std::to_string(excess) + " segment(s)");
        }

        processed_sequences_.insert(seq);
        metadata_.processed_chunks = static_cast<int>(processed_sequences_.size());
        metadata_.last_update_time = now;
        modified_ = true;
        update_estimate_locked();
    }
    notify();
}

void RealtimeTextManager::on_chunk_result(const ChunkResult& result) {
    if (result.status == ChunkStatus::completed) {
        add_result(result, result.chunk_id);
        return;
    }
    if (result.status != ChunkStatus::failed) return;

    {
        std::lock_guard<std::mutex> lock(mu_);
        ++metadata_.error_count;
        if (result.terminal) {
            metadata_.status = RealtimeStatus::error;
        }
        metadata_.last_update_time = unix_time_ms();
        modified_ = true;
    }
    notify();
}

void RealtimeTextManager::set_total_chunks(int total) {
    std::lock_guard<std::mutex> lock(mu_);
    metadata_.total_chunks = total;
    update_estimate_locked();
}

void RealtimeTextManager::update_estimate_locked() {
    const int done = metadata_.processed_chunks;
    if (done <= 0 || metadata_.total_chunks <= done) {
        metadata_.estimated_duration_ms = 0;
        return;
    }
    int64_t elapsed = unix_time_ms() - metadata_.start_time;
    int64_t per_chunk = elapsed / done;
    metadata_.estimated_duration_ms = per_chunk * (metadata_.total_chunks - done);
}

// ---------------------------------------------------------------------------
// Text generation
// ---------------------------------------------------------------------------

std::string RealtimeTextManager::generate_full_text() const {
    std::lock_guard<std::mutex> lock(mu_);
    return full_text_locked();
}

std::string RealtimeTextManager::full_text_locked() const {
    if (buffer_.empty()) return "";

    std::vector<RealtimeTextSegment> sorted = buffer_;
    std::stable_sort(sorted.begin(), sorted.end(), by_chunk_then_index);

    std::map<std::pair<int64_t, int64_t>, const RealtimeTextSegment*> buckets;
    for (const auto& seg : sorted) {
        auto key = std::make_pair(static_cast<int64_t>(std::floor(seg.start)),
                                  static_cast<int64_t>(std::floor(seg.end)));
        auto it = buckets.find(key);
        if (it == buckets.end() || seg.chunk_sequence > it->second->chunk_sequence) {
            buckets[key] = &seg;
        }
    }

    std::vector<const RealtimeTextSegment*> final_segments;
    for (const auto& [key, seg] : buckets) final_segments.push_back(seg);
    std::stable_sort(final_segments.begin(), final_segments.end(),
                     [](const RealtimeTextSegment* a, const RealtimeTextSegment* b) {
                         return a->start < b->start;
                     });

    std::string text;
    for (const auto* seg : final_segments) {
        if (!text.empty() && text.back() != ' ' && !ends_with(text, kIdeographicFullStop)) {
            text += ' ';
        }
        text += seg->text;
    }

    size_t b = text.find_first_not_of(' ');
    if (b == std::string::npos) return "";
    size_t e = text.find_last_not_of(' ');
    return text.substr(b, e - b + 1);
}

std::string RealtimeTextManager::generate_file_content() const {
    std::lock_guard<std::mutex> lock(mu_);
    return file_content_locked();
}

std::string RealtimeTextManager::file_content_locked() const {
    std::string full_text = full_text_locked();
    if (config_.file_format == RealtimeFileFormat::simple) {
        return full_text;
    }

    std::ostringstream ss;
    ss << "# Realtime Transcript\n\n"
       << "## Metadata\n"
       << "status: " << realtime_status_to_string(metadata_.status) << '\n'
       << "processed_chunks: " << metadata_.processed_chunks << '\n'
       << "total_chunks: " << metadata_.total_chunks << '\n'
       << "start_time: " << format_iso8601(metadata_.start_time) << '\n'
       << "last_update: " << format_iso8601(metadata_.last_update_time) << '\n'
       << "error_count: " << metadata_.error_count << '\n'
       << '\n'
       << "## Transcript\n"
       << full_text << '\n'
       << '\n'
       << "## Progress\n";

    if (metadata_.status == RealtimeStatus::transcribing) {
        ss << "Transcribing...\n";
        if (metadata_.estimated_duration_ms > 0) {
            int64_t minutes = (metadata_.estimated_duration_ms + 59999) / 60000;
            ss << "Estimated time remaining: about " << minutes << " min\n";
        }
    } else if (metadata_.status == RealtimeStatus::completed) {
        ss << "Transcription complete\n";
    } else if (metadata_.status == RealtimeStatus::error) {
        ss << "Transcription stopped after errors\n";
    }

    if (!buffer_.empty()) {
        ss << "\n## Chunk details\n";
        size_t i = 0;
        while (i < buffer_.size()) {
            int32_t seq = buffer_[i].chunk_sequence;
            size_t j = i;
            while (j < buffer_.size() && buffer_[j].chunk_sequence == seq) ++j;

            ss << "### Chunk " << seq << ": " << buffer_[i].chunk_filename << '\n'
               << "segments: " << (j - i) << '\n';
            for (size_t k = i; k < j; ++k) {
                ss << '[' << static_cast<int64_t>(std::floor(buffer_[k].start)) << "s-"
                   << static_cast<int64_t>(std::floor(buffer_[k].end)) << "s] "
                   << buffer_[k].text << '\n';
            }
            ss << '\n';
            i = j;
        }
    }
    return ss.str();
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

bool RealtimeTextManager::flush() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!modified_) return true;
    return write_locked();
}

bool RealtimeTextManager::write_locked() {
    if (output_path_.empty()) return false;

    if (!write_text_file(output_path_, file_content_locked())) {
        ++write_errors_;
        ++metadata_.error_count;
        return false;
    }
    modified_ = false;
    CS_LOG_DEBUG("Realtime transcript written: " + output_path_);
    return true;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::vector<RealtimeTextSegment> RealtimeTextManager::get_segments() const {
    std::lock_guard<std::mutex> lock(mu_);
    return buffer_;
}

RealtimeMetadata RealtimeTextManager::get_metadata() const {
    std::lock_guard<std::mutex> lock(mu_);
    return metadata_;
}

bool RealtimeTextManager::is_modified() const {
    std::lock_guard<std::mutex> lock(mu_);
    return modified_;
}

std::string RealtimeTextManager::output_path() const {
    std::lock_guard<std::mutex> lock(mu_);
    return output_path_;
}

void RealtimeTextManager::notify() {
    std::vector<TextUpdateObserver*> observers;
    std::string text;
    RealtimeMetadata md;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (observers_.empty()) return;
        observers = observers_;
        text = full_text_locked();
        md = metadata_;
    }
    for (auto* o : observers) o->on_text_update(text, md);
}

} // namespace cs
