#include "TranscriptionQueue.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cs {

namespace {

// ---------------------------------------------------------------------------
// RAII temp file holding one chunk for the duration of a service call
// ---------------------------------------------------------------------------

class TempFile {
public:
    TempFile(std::string path, const std::vector<uint8_t>& data)
        : path_(std::move(path)) {
        std::ofstream out(path_, std::ios::binary);
        if (!out.is_open()) return;
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        ok_ = out.good();
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    bool ok() const { return ok_; }

private:
    std::string path_;
    bool ok_ = false;
};

constexpr double kDefaultSegmentConfidence = 0.8;

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TranscriptionQueue::TranscriptionQueue(TranscriptionService& service, QueueConfig config)
    : service_(service), config_(std::move(config)) {
    std::error_code ec;
    std::filesystem::path dir = config_.temp_dir;
    if (dir.empty()) {
        dir = std::filesystem::temp_directory_path(ec) / "chunkscribe";
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        CS_LOG_WARNING("Cannot create temp directory " + dir.string() + ": " + ec.message());
    }
    temp_dir_ = dir.string();
}

TranscriptionQueue::~TranscriptionQueue() {
    stop();
}

void TranscriptionQueue::add_observer(ResultObserver* observer) {
    std::lock_guard<std::mutex> lock(mu_);
    if (observer) observers_.push_back(observer);
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

bool TranscriptionQueue::start() {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return false;

    running_ = true;
    int n = std::max(1, config_.max_concurrency);
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back(&TranscriptionQueue::worker_loop, this);
    }
    CS_LOG_INFO("Transcription queue started with " + std::to_string(n) + " worker(s)");
    return true;
}

void TranscriptionQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    idle_cv_.notify_all();
}

bool TranscriptionQueue::is_running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
}

bool TranscriptionQueue::is_halted() const {
    std::lock_guard<std::mutex> lock(mu_);
    return halted_;
}

// ---------------------------------------------------------------------------
// enqueue
// ---------------------------------------------------------------------------

void TranscriptionQueue::enqueue(const AudioChunk& chunk, int total_chunks_known) {
    std::lock_guard<std::mutex> lock(mu_);

    known_total_ = std::max(known_total_, total_chunks_known > 0
                                              ? total_chunks_known
                                              : chunk.sequence_number + 1);

    auto it = items_.find(chunk.id);
    if (it != items_.end() && it->second.item.state == QueueItemState::processing) {
        CS_LOG_DEBUG("Chunk " + chunk.id + " is already being transcribed; ignoring");
        return;
    }

    Entry e;
    e.item.chunk = chunk;
    e.item.priority = std::max(known_total_ - chunk.sequence_number, 0);
    e.item.max_retries = config_.max_retries;
    e.item.added_at = unix_time_ms();
    e.item.state = QueueItemState::pending;
    e.order = next_order_++;
    items_[chunk.id] = std::move(e);

    CS_LOG_DEBUG("Queued chunk " + chunk.id + " (sequence " +
                 std::to_string(chunk.sequence_number) + ")");
    cv_.notify_one();
}

// ---------------------------------------------------------------------------
// Worker
// ---------------------------------------------------------------------------

TranscriptionQueue::Entry* TranscriptionQueue::next_ready(
    std::chrono::steady_clock::time_point now) {
    Entry* best = nullptr;
    for (auto& [id, e] : items_) {
        if (e.item.state != QueueItemState::pending || e.item.ready_at > now) continue;
        if (!best || e.item.priority > best->item.priority ||
            (e.item.priority == best->item.priority && e.order < best->order)) {
            best = &e;
        }
    }
    return best;
}

std::optional<std::chrono::steady_clock::time_point>
TranscriptionQueue::earliest_pending() const {
    std::optional<std::chrono::steady_clock::time_point> earliest;
    for (const auto& [id, e] : items_) {
        if (e.item.state != QueueItemState::pending) continue;
        if (!earliest || e.item.ready_at < *earliest) earliest = e.item.ready_at;
    }
    return earliest;
}

void TranscriptionQueue::worker_loop() {
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
        if (halted_) {
            cv_.wait(lock, [this] { return !running_; });
            break;
        }

        Entry* e = next_ready(std::chrono::steady_clock::now());
        if (!e) {
            auto earliest = earliest_pending();
            if (earliest) {
                cv_.wait_until(lock, *earliest);
            } else {
                cv_.wait(lock);
            }
            continue;
        }

        e->item.state = QueueItemState::processing;
        e->item.started_at = unix_time_ms();
        AudioChunk chunk = e->item.chunk;
        lock.unlock();

        auto t0 = std::chrono::steady_clock::now();
        Attempt attempt = run_attempt(chunk);
        int64_t elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        lock.lock();
        std::vector<ChunkResult> results = settle(chunk.id, std::move(attempt), elapsed);
        ++emitting_;
        lock.unlock();

        emit(results);

        lock.lock();
        --emitting_;
        idle_cv_.notify_all();
    }
}

TranscriptionQueue::Attempt TranscriptionQueue::run_attempt(const AudioChunk& chunk) {
    Attempt a;

    if (chunk.kind == ChunkKind::live_placeholder) {
        a.ok = true;
        return a;
    }
    if (chunk.audio_data.empty()) {
        a.kind = ErrorKind::audio_quality;
        a.message = "no audio data in chunk";
        return a;
    }

    std::string path = (std::filesystem::path(temp_dir_) /
                        (chunk.id + "_" + std::to_string(temp_counter_++) + ".webm"))
                           .string();
    TempFile tmp(path, chunk.audio_data);
    if (!tmp.ok()) {
        a.kind = ErrorKind::file_error;
        a.message = "failed to write temp file " + path;
        return a;
    }

    try {
        a.response = service_.transcribe(tmp.path());
        a.ok = true;
    } catch (const TranscriptionError& e) {
        a.kind = e.kind();
        a.message = e.what();
    } catch (const std::exception& e) {
        a.kind = classify_error(e.what());
        a.message = e.what();
    }
    return a;
}

// ---------------------------------------------------------------------------
// settle
// ---------------------------------------------------------------------------

std::vector<ChunkResult> TranscriptionQueue::settle(const std::string& chunk_id,
                                                    Attempt attempt,
                                                    int64_t elapsed_ms) {
    std::vector<ChunkResult> out;

    auto it = items_.find(chunk_id);
    if (it == items_.end()) return out;
    QueueItem& item = it->second.item;

    ChunkResult result;
    result.chunk_id = item.chunk.id;
    result.sequence_number = item.chunk.sequence_number;
    result.processing_time_ms = elapsed_ms;

    if (attempt.ok) {
        error_streak_.clear();
        item.state = QueueItemState::completed;
        item.completed_at = unix_time_ms();

        double sum = 0.0;
        int scored = 0;
        for (auto& seg : attempt.response.segments) {
            seg.start += item.chunk.start_time;
            seg.end += item.chunk.start_time;
            if (seg.confidence) {
                sum += *seg.confidence;
                ++scored;
            }
        }
        double confidence = 0.0;
        if (!attempt.response.segments.empty()) {
            confidence = scored > 0 ? sum / scored : kDefaultSegmentConfidence;
        }
        for (auto& seg : attempt.response.segments) {
            if (!seg.confidence) seg.confidence = confidence;
        }

        result.status = ChunkStatus::completed;
        result.segments = std::move(attempt.response.segments);
        result.confidence = confidence;

        CS_LOG_INFO("Chunk " + chunk_id + " transcribed: " +
                    std::to_string(result.segments.size()) + " segment(s) in " +
                    std::to_string(elapsed_ms) + " ms");
        results_.push_back(result);
        out.push_back(std::move(result));
        return out;
    }

    item.last_error = attempt.message;
    item.last_error_kind = attempt.kind;

    auto now = std::chrono::steady_clock::now();
    error_streak_.push_back(now);
    while (now - error_streak_.front() > std::chrono::milliseconds(config_.breaker_window_ms)) {
        error_streak_.pop_front();
    }
    int streak = static_cast<int>(error_streak_.size());

    if (!halted_ && is_unreachable(attempt.kind) && streak >= config_.breaker_threshold) {
        halted_ = true;
        item.state = QueueItemState::failed;
        item.completed_at = unix_time_ms();

        result.status = ChunkStatus::failed;
        result.error_kind = attempt.kind;
        result.terminal = true;
        result.error = "Transcription service unreachable after " +
                       std::to_string(streak) +
                       " consecutive failures; restart it and try again";
        CS_LOG_ERROR(result.error + " (last error: " + attempt.message + ")");

        results_.push_back(result);
        out.push_back(std::move(result));
        cv_.notify_all();
        return out;
    }

    if (!halted_ && is_retryable(attempt.kind) && item.retry_count < item.max_retries) {
        ++item.retry_count;
        item.priority = std::max(item.priority - 1, 0);
        item.state = QueueItemState::pending;
        int64_t delay = retry_delay_ms(item.retry_count, config_.retry_base_delay_ms,
                                       config_.retry_max_delay_ms);
        item.ready_at = now + std::chrono::milliseconds(delay);

        CS_LOG_WARNING("Chunk " + chunk_id + " failed (" + attempt.message + "); retry " +
                       std::to_string(item.retry_count) + "/" +
                       std::to_string(item.max_retries) + " in " +
                       std::to_string(delay) + " ms");
        cv_.notify_all();
        return out;
    }

    item.state = QueueItemState::failed;
    item.completed_at = unix_time_ms();

    result.status = ChunkStatus::failed;
    result.error_kind = attempt.kind;
    result.error = "[Chunk " + std::to_string(item.chunk.sequence_number + 1) + "] " +
                   user_message(attempt.kind, attempt.message);
    if (attempt.kind == ErrorKind::file_error) {
        CS_LOG_ERROR(result.error);
    } else {
        CS_LOG_WARNING(result.error);
    }

    results_.push_back(result);
    out.push_back(std::move(result));
    return out;
}

void TranscriptionQueue::emit(const std::vector<ChunkResult>& results) {
    std::vector<ResultObserver*> observers;
    {
        std::lock_guard<std::mutex> lock(mu_);
        observers = observers_;
    }
    for (const auto& r : results) {
        for (auto* o : observers) o->on_chunk_result(r);
    }
}

// ---------------------------------------------------------------------------
// Idle / snapshots
// ---------------------------------------------------------------------------

bool TranscriptionQueue::idle_locked() const {
    if (emitting_ > 0) return false;
    for (const auto& [id, e] : items_) {
        if (e.item.state == QueueItemState::processing) return false;
        if (e.item.state == QueueItemState::pending && !halted_) return false;
    }
    return true;
}

bool TranscriptionQueue::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return idle_cv_.wait_for(lock, timeout, [this] { return idle_locked(); });
}

std::vector<ChunkResult> TranscriptionQueue::get_results() const {
    std::lock_guard<std::mutex> lock(mu_);
    return results_;
}

std::vector<ChunkResult> TranscriptionQueue::get_completed_results() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ChunkResult> out;
    for (const auto& r : results_) {
        if (r.status == ChunkStatus::completed) out.push_back(r);
    }
    return out;
}

std::vector<QueueItem> TranscriptionQueue::get_failed_items() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<QueueItem> out;
    for (const auto& [id, e] : items_) {
        if (e.item.state == QueueItemState::failed) out.push_back(e.item);
    }
    return out;
}

std::optional<QueueItem> TranscriptionQueue::get_item(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = items_.find(chunk_id);
    if (it == items_.end()) return std::nullopt;
    return it->second.item;
}

QueueStats TranscriptionQueue::get_stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    QueueStats s;
    s.total = static_cast<int>(items_.size());
    for (const auto& [id, e] : items_) {
        switch (e.item.state) {
            case QueueItemState::pending:    ++s.pending; break;
            case QueueItemState::processing: ++s.processing; break;
            case QueueItemState::completed:  ++s.completed; break;
            case QueueItemState::failed:     ++s.failed; break;
        }
    }
    int timed = 0;
    for (const auto& r : results_) {
        if (r.status != ChunkStatus::completed) continue;
        s.total_processing_time_ms += r.processing_time_ms;
        ++timed;
    }
    if (timed > 0) {
        s.average_processing_time_ms =
            static_cast<double>(s.total_processing_time_ms) / timed;
    }
    s.halted = halted_;
    return s;
}

int64_t TranscriptionQueue::retry_delay_ms(int retry_count, int base_ms, int cap_ms) {
    if (retry_count < 1) retry_count = 1;
    int64_t delay = base_ms;
    for (int i = 1; i < retry_count && delay < cap_ms; ++i) {
        delay *= 2;
    }
    return std::min<int64_t>(delay, cap_ms);
}

} // namespace cs
