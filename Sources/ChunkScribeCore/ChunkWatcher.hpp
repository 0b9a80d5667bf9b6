#pragma once

#include "ChunkExtractor.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace cs {

struct WatcherConfig {
    std::string     directory;
    int             interval_ms = 1000;
    int             stability_delay_ms = 500;
    uint64_t        min_file_size = 1000;
    bool            watch_live_recordings = true;
    ExtractorConfig extractor;
};

/// Receives watcher events on the polling thread.
class ChunkObserver {
public:
    virtual ~ChunkObserver() = default;

    /// A chunk file became stable (new, or its size changed).
    virtual void on_chunk_file(const ChunkFileInfo& /*info*/) {}

    /// An AudioChunk is ready: read from a chunk file or extracted from a
    /// live recording.
    virtual void on_audio_chunk(const AudioChunk& /*chunk*/) {}
};

/// Polls a directory for chunk files and growing recordings.
///
///   timerange_chunk_NNN.webm      -> read whole, once per (name, size)
///   truediff_chunk_NNN.webm       -> same
///   differential_chunk_NNN.webm   -> same
///   recording_*.webm              -> ChunkExtractor, once per sequence
///
/// Sequence numbers of different sources share one timeline, so a watcher
/// follows a single source: the chunk-file series or one live recording,
/// whichever it sees first. Other matching files are ignored.
class ChunkWatcher {
public:
    explicit ChunkWatcher(WatcherConfig config);
    ~ChunkWatcher();

    // Non-copyable.
    ChunkWatcher(const ChunkWatcher&) = delete;
    ChunkWatcher& operator=(const ChunkWatcher&) = delete;

    /// Register an observer. Observers are notified in registration order and
    /// must outlive the watcher.
    void add_observer(ChunkObserver* observer);

    /// Start the background poll loop. Returns false if already running.
    bool start();

    /// Halt polling. No further events are produced.
    void stop();

    /// Halt polling, then emit the remaining tail of every live recording.
    void finish();

    bool is_watching() const;

    /// Run one poll pass on the calling thread.
    void poll_once();

    void mark_processed(const std::string& filename);

    /// Detected but not yet processed files, ordered by sequence number.
    std::vector<ChunkFileInfo> get_pending_files() const;

    WatcherStats get_stats() const;

    /// Classify a filename. nullopt if it is neither a chunk file nor a
    /// live recording.
    static std::optional<ChunkFileInfo> parse_filename(const std::string& filename);

private:
    enum class Source { none, chunk_files, live_recording };

    struct LiveRecording {
        std::unique_ptr<FileByteSource>         source;
        std::unique_ptr<ChunkExtractor>         extractor;
        std::chrono::steady_clock::time_point   first_seen;
    };

    void run();

    void scan_chunk_file(ChunkFileInfo info,
                         std::vector<ChunkFileInfo>& files,
                         std::vector<AudioChunk>& chunks);
    void poll_live(const ChunkFileInfo& info, std::vector<AudioChunk>& chunks);

    /// Bind the watcher to the source `info` belongs to on first sight.
    /// False if `info` belongs to another source.
    bool claim_source(const ChunkFileInfo& info);
    void drain_live(LiveRecording& live, double elapsed, bool final,
                    std::vector<AudioChunk>& chunks);

    void notify(const std::vector<ChunkFileInfo>& files,
                const std::vector<AudioChunk>& chunks);

    double elapsed_since(std::chrono::steady_clock::time_point t) const;

    WatcherConfig                           config_;
    std::vector<ChunkObserver*>             observers_;

    std::map<std::string, ChunkFileInfo>    detected_;      // by filename
    std::set<std::string>                   processed_;
    std::map<std::string, LiveRecording>    live_;
    Source                                  source_ = Source::none;
    std::string                             live_name_;     // when source_ is live
    std::set<std::string>                   ignored_;
    bool                                    missing_dir_logged_ = false;

    std::atomic<bool>                       running_{false};
    std::thread                             thread_;
    std::condition_variable                 cv_;
    std::mutex                              poll_mu_;       // one poll at a time
    mutable std::mutex                      mu_;
};

} // namespace cs
