#pragma once

#include "Types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace cs {

/// Persistent storage for transcription sessions and their per-chunk results.
///
///   sessions        one row per recording / chunk directory
///   chunk_results   one row per (session, chunk id), replaced on retry
///   segments        recognised text of a chunk result
///
/// Chunk results are stored as they arrive so an interrupted session can be
/// consolidated later from what was already transcribed.
///
/// Uses SQLite WAL mode for crash-safe writes.  All mutating operations
/// are wrapped in explicit transactions.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Non-copyable.
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /// Open (or create) the database.  Returns false on failure.
    /// Automatically creates tables.
    bool open();

    void close();

    bool is_open() const;

    const std::string& path() const { return db_path_; }

    // ---- Sessions ----

    /// Create a new session in 'recording' status.  Returns the generated
    /// UUID, or an empty string on failure.
    std::string create_session(const std::string& source_path);

    /// Store the consolidated transcript and mark the session complete.
    bool update_transcript(const std::string& session_id,
                           const std::string& transcript,
                           int64_t duration_ms);

    bool mark_failed(const std::string& session_id);

    bool update_status(const std::string& session_id, RecordingStatus status);

    bool update_duration(const std::string& session_id, int64_t duration_ms);

    std::optional<RecordingSession> get_session(const std::string& session_id) const;

    /// All sessions, most recent first.
    std::vector<RecordingSession> get_sessions() const;

    /// Delete a session with its chunk results and segments.
    bool delete_session(const std::string& session_id);

    /// Sessions left in 'recording' or 'transcribing' status by a process
    /// that did not shut down cleanly.
    std::vector<RecordingSession> get_orphaned_sessions() const;

    // ---- Chunk results ----

    /// Insert or replace the result for (session_id, result.chunk_id).
    bool save_chunk_result(const std::string& session_id, const ChunkResult& result);

    /// All stored results of a session, ordered by sequence number.
    std::vector<ChunkResult> get_chunk_results(const std::string& session_id) const;

private:
    bool create_tables();

    /// Generate a UUID v4 string.
    static std::string generate_uuid();

    /// Current Unix timestamp in seconds.
    static int64_t now_unix();

    std::string     db_path_;
    sqlite3*        db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace cs
