#pragma once

#include "TranscriptionQueue.hpp"
#include "Types.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace cs {

enum class RealtimeFileFormat {
    detailed,   // metadata, body, per-chunk detail
    simple      // body only
};

enum class RealtimeStatus {
    idle,
    transcribing,
    completed,
    error
};

const char* realtime_status_to_string(RealtimeStatus s);

struct RealtimeTextConfig {
    int                 write_interval_ms = 3000;
    size_t              buffer_size = 1000;
    bool                enable_auto_save = true;
    RealtimeFileFormat  file_format = RealtimeFileFormat::detailed;
    double              chunk_interval_seconds = 5.0;   // timerange_chunk_ ranges
    int                 max_write_errors = 5;
};

struct RealtimeMetadata {
    RealtimeStatus status = RealtimeStatus::idle;
    int            processed_chunks = 0;
    int            total_chunks = 0;
    int64_t        start_time = 0;          // Unix ms
    int64_t        last_update_time = 0;
    int            error_count = 0;
    int64_t        estimated_duration_ms = 0;   // remaining, 0 if unknown
};

/// Notified after every buffer change, on the thread that made it.
class TextUpdateObserver {
public:
    virtual ~TextUpdateObserver() = default;
    virtual void on_text_update(const std::string& full_text,
                                const RealtimeMetadata& metadata) = 0;
};

/// Streaming transcript: a bounded buffer of segments, deduplicated by
/// integer-second bucket on read, flushed to `<name>.rt.txt` on a timer
/// whenever it changed.
class RealtimeTextManager : public ResultObserver {
public:
    explicit RealtimeTextManager(RealtimeTextConfig config = {});
    ~RealtimeTextManager() override;

    // Non-copyable.
    RealtimeTextManager(const RealtimeTextManager&) = delete;
    RealtimeTextManager& operator=(const RealtimeTextManager&) = delete;

    /// Observers must outlive the manager.
    void add_observer(TextUpdateObserver* observer);

    /// Begin a session writing to `output_path`; starts the autosave timer.
    void start(const std::string& output_path);

    /// Stop the timer, mark the session completed and write a final time.
    void stop();

    /// Replace the chunk's earlier segments with `result`'s. Results from
    /// timerange_chunk_ files replace buffered segments by time range instead.
    void add_result(const ChunkResult& result, const std::string& chunk_filename);

    /// ResultObserver: completed results are added, failed ones counted.
    void on_chunk_result(const ChunkResult& result) override;

    void set_total_chunks(int total);

    /// Deduplicated text: one segment per (floor(start), floor(end)) bucket,
    /// highest chunk sequence wins, ordered by start.
    std::string generate_full_text() const;

    std::string generate_file_content() const;

    /// Write now if modified. Returns false on write failure.
    bool flush();

    std::vector<RealtimeTextSegment> get_segments() const;
    RealtimeMetadata get_metadata() const;
    bool is_modified() const;
    std::string output_path() const;

    /// "<dir>/<stem>.rt.txt" for an audio or transcript path.
    static std::string output_path_for(const std::string& path);

private:
    void run_autosave();
    bool write_locked();
    std::string full_text_locked() const;
    std::string file_content_locked() const;
    void update_estimate_locked();
    void notify();

    RealtimeTextConfig                  config_;
    std::vector<TextUpdateObserver*>    observers_;

    std::vector<RealtimeTextSegment>    buffer_;
    std::set<int32_t>                   processed_sequences_;
    RealtimeMetadata                    metadata_;
    std::string                         output_path_;
    bool                                modified_ = false;
    int                                 write_errors_ = 0;

    bool                                running_ = false;
    std::thread                         timer_;
    std::condition_variable             cv_;
    mutable std::mutex                  mu_;
};

} // namespace cs
