#pragma once

#include "ChunkWatcher.hpp"
#include "ConfigLoader.hpp"
#include "DatabaseManager.hpp"
#include "RealtimeTextManager.hpp"
#include "ResultConsolidator.hpp"
#include "TranscriptionQueue.hpp"
#include "Types.hpp"
#include "WhisperTranscriber.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cs {

/// High-level orchestrator for one transcription session at a time:
///
///   start_session(dir)  -->  watcher  -->  queue  -->  stop_session()
///          |                                 |               |
///     create session                 store each result   consolidate
///                                    + realtime text     + transcript file
///
/// On init, performs crash recovery: sessions left in 'recording' or
/// 'transcribing' status are consolidated from the chunk results already
/// stored for them.
class SessionManager : public ChunkObserver, public ResultObserver {
public:
    /// `service` overrides the built-in whisper transcriber; it must outlive
    /// the manager.
    explicit SessionManager(PipelineConfig config, TranscriptionService* service = nullptr);
    ~SessionManager() override;

    // Non-copyable.
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Open the database, load the whisper model (unless a service was
    /// injected) and recover orphaned sessions. False if the database
    /// cannot be opened. A model that fails to load is logged; chunks then
    /// fail as service_unavailable.
    bool init();

    // ---- Session lifecycle ----

    /// Start watching `directory`. The final transcript goes to
    /// `output_path` (default: <directory>/transcript.txt) and the streaming
    /// one next to it as <stem>.rt.txt. Returns the session id, or an empty
    /// string if a session is already active or cannot be created.
    std::string start_session(const std::string& directory,
                              const std::string& output_path = "");

    /// Emit the remaining tail, wait for the queue to drain, consolidate and
    /// write the transcript. Returns false if nothing could be transcribed.
    bool stop_session();

    bool is_active() const;
    std::string current_session_id() const;

    /// Re-consolidate a stored session from its chunk results.
    bool consolidate_session(const std::string& session_id,
                             const std::string& output_path = "");

    // ---- Data access (delegates to DatabaseManager) ----

    std::vector<RecordingSession> get_sessions() const;
    std::optional<RecordingSession> get_session(const std::string& id) const;
    bool delete_session(const std::string& id);

    /// Called automatically during init().
    void recover_orphaned_sessions();

    /// Transcript path used when none is given.
    static std::string default_output_path(const std::string& source_path);

    // ChunkObserver
    void on_chunk_file(const ChunkFileInfo& info) override;
    void on_audio_chunk(const AudioChunk& chunk) override;

    // ResultObserver
    void on_chunk_result(const ChunkResult& result) override;

private:
    /// Consolidate `results`, write the transcript and store it. Returns
    /// false (and marks the session failed) if no chunk was transcribed.
    bool finalize(const std::string& session_id,
                  const std::string& source_path,
                  const std::string& output_path,
                  const std::vector<ChunkResult>& results,
                  std::optional<double> duration);

    // ---- Subsystems ----
    PipelineConfig          config_;
    DatabaseManager         db_;
    WhisperTranscriber      whisper_;
    TranscriptionService*   service_;
    ResultConsolidator      consolidator_;

    // ---- Per-session pipeline ----
    std::unique_ptr<RealtimeTextManager>    realtime_;
    std::unique_ptr<TranscriptionQueue>     queue_;
    std::unique_ptr<ChunkWatcher>           watcher_;

    // ---- State ----
    std::string         current_session_id_;
    std::string         current_directory_;
    std::string         current_output_path_;
    double              recorded_until_ = 0.0;  // latest chunk end, seconds
    std::map<std::string, std::string> chunk_files_;   // chunk id -> watched filename
    mutable std::mutex  mu_;
};

} // namespace cs
