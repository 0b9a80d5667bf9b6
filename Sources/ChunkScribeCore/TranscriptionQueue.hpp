#pragma once

#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cs {

/// What a transcription service returns for one audio file.
struct TranscriptionResponse {
    std::vector<TranscriptionSegment> segments;    // chunk-local times
    double      duration = 0.0;
    std::string language;
};

/// Speech-to-text for a single audio file. Implementations report failures
/// by throwing TranscriptionError.
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;
    virtual TranscriptionResponse transcribe(const std::string& audio_path) = 0;
};

/// Receives every ChunkResult the queue emits, on a worker thread.
class ResultObserver {
public:
    virtual ~ResultObserver() = default;
    virtual void on_chunk_result(const ChunkResult& result) = 0;
};

struct QueueConfig {
    int         max_concurrency = 2;
    int         max_retries = 3;
    int         retry_base_delay_ms = 1000;
    int         retry_max_delay_ms = 5000;
    int         breaker_threshold = 5;
    int         breaker_window_ms = 30000;
    std::string temp_dir;       // empty: system temp directory
};

/// Bounded-concurrency, priority-ordered transcription queue.
///
///   pending --> processing --> completed
///      ^            |
///      +-- retry ---+-------> failed
///
/// Failed attempts are rescheduled as pending items with a ready_at time.
/// breaker_threshold consecutive failures inside one breaker_window_ms, the
/// last of them an unreachable-service error, trip a circuit breaker that
/// halts the queue and emits a single terminal result.
class TranscriptionQueue {
public:
    TranscriptionQueue(TranscriptionService& service, QueueConfig config = {});
    ~TranscriptionQueue();

    // Non-copyable.
    TranscriptionQueue(const TranscriptionQueue&) = delete;
    TranscriptionQueue& operator=(const TranscriptionQueue&) = delete;

    /// Observers must outlive the queue.
    void add_observer(ResultObserver* observer);

    /// Spawn the worker threads. Returns false if already running.
    bool start();

    /// Stop dequeuing. In-flight calls finish and their results are emitted.
    void stop();

    bool is_running() const;

    /// True once the circuit breaker has tripped.
    bool is_halted() const;

    /// Queue a chunk. `total_chunks_known` feeds the priority; pass 0 to let
    /// the queue track it from the sequence numbers it has seen.
    void enqueue(const AudioChunk& chunk, int total_chunks_known = 0);

    /// Block until nothing is pending or processing (or the queue halted and
    /// nothing is processing). False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    // ---- Snapshots ----

    std::vector<ChunkResult> get_results() const;
    std::vector<ChunkResult> get_completed_results() const;
    std::vector<QueueItem> get_failed_items() const;
    std::optional<QueueItem> get_item(const std::string& chunk_id) const;
    QueueStats get_stats() const;

    /// min(base * 2^(retry_count - 1), cap)
    static int64_t retry_delay_ms(int retry_count, int base_ms, int cap_ms);

private:
    struct Entry {
        QueueItem item;
        uint64_t  order = 0;    // insertion order, tie-break for priority
    };

    struct Attempt {
        bool                    ok = false;
        TranscriptionResponse   response;
        ErrorKind               kind = ErrorKind::none;
        std::string             message;
    };

    void worker_loop();

    /// Highest-priority pending entry whose ready_at has passed.
    Entry* next_ready(std::chrono::steady_clock::time_point now);
    std::optional<std::chrono::steady_clock::time_point> earliest_pending() const;

    Attempt run_attempt(const AudioChunk& chunk);

    /// Apply an attempt's outcome. Returns the results to emit.
    std::vector<ChunkResult> settle(const std::string& chunk_id,
                                    Attempt attempt,
                                    int64_t elapsed_ms);

    bool idle_locked() const;
    void emit(const std::vector<ChunkResult>& results);

    TranscriptionService&           service_;
    QueueConfig                     config_;
    std::vector<ResultObserver*>    observers_;

    std::map<std::string, Entry>    items_;         // by chunk id
    std::vector<ChunkResult>        results_;
    uint64_t                        next_order_ = 0;
    int                             known_total_ = 0;
    std::atomic<uint64_t>           temp_counter_{0};
    std::string                     temp_dir_;

    // Failure times of the current streak that fall inside the breaker window.
    std::deque<std::chrono::steady_clock::time_point> error_streak_;
    bool                            halted_ = false;

    bool                            running_ = false;
    int                             emitting_ = 0;  // settled, observers not yet told
    std::vector<std::thread>        workers_;
    std::condition_variable         cv_;
    std::condition_variable         idle_cv_;
    mutable std::mutex              mu_;
};

} // namespace cs
