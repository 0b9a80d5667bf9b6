#include "DatabaseManager.hpp"

#include "Logger.hpp"

#include <chrono>
#include <filesystem>
#include <random>
#include <system_error>

#include <sqlite3.h>

namespace cs {

namespace {

void log_sqlite_error(sqlite3* db, const std::string& what) {
    CS_LOG_ERROR("SQLite " + what + " failed: " + sqlite3_errmsg(db));
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return t ? t : "";
}

int64_t column_int64_or_zero(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt, col);
}

} // namespace

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        ok_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
        if (!ok_) log_sqlite_error(db_, "BEGIN");
    }
    bool ok() const { return ok_; }
    bool commit() {
        if (!committed_) {
            if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                log_sqlite_error(db_, "COMMIT");
                return false;
            }
            committed_ = true;
        }
        return true;
    }
    ~Transaction() {
        if (ok_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

private:
    sqlite3* db_;
    bool ok_ = false;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            log_sqlite_error(db, "prepare");
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

namespace {

const char* const kSessionColumns =
    "SELECT id, created_at, completed_at, status, source_path, duration_ms, transcript "
    "FROM sessions ";

RecordingSession read_session(sqlite3_stmt* stmt) {
    RecordingSession s;
    s.id           = column_string(stmt, 0);
    s.created_at   = sqlite3_column_int64(stmt, 1);
    s.completed_at = column_int64_or_zero(stmt, 2);
    s.status       = status_from_string(column_string(stmt, 3));
    s.source_path  = column_string(stmt, 4);
    s.duration_ms  = column_int64_or_zero(stmt, 5);
    s.transcript   = column_string(stmt, 6);
    return s;
}

std::vector<RecordingSession> read_sessions(sqlite3* db, const std::string& where) {
    std::vector<RecordingSession> results;
    std::string sql = std::string(kSessionColumns) + where;
    Statement stmt(db, sql.c_str());
    if (!stmt.ok()) return results;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_session(stmt));
    }
    return results;
}

bool exec_for_session(sqlite3* db, const char* sql, const std::string& session_id) {
    Statement stmt(db, sql);
    if (!stmt.ok()) return false;
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        log_sqlite_error(db, "delete");
        return false;
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

DatabaseManager::DatabaseManager(const std::string& db_path)
    : db_path_(db_path) {}

DatabaseManager::~DatabaseManager() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool DatabaseManager::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;   // already open

    if (db_path_.empty()) return false;

    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            CS_LOG_ERROR("Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        CS_LOG_ERROR("Cannot open database " + db_path_ +
                     (db_ ? std::string(": ") + sqlite3_errmsg(db_) : std::string()));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    // WAL for crash safety and concurrent reads.
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr) != SQLITE_OK) {
        log_sqlite_error(db_, "journal_mode");
    }
    if (sqlite3_exec(db_, "PRAGMA foreign_keys=ON", nullptr, nullptr, nullptr) != SQLITE_OK) {
        log_sqlite_error(db_, "foreign_keys");
    }

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    CS_LOG_DEBUG("Database opened: " + db_path_);
    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

// ---------------------------------------------------------------------------
// create_tables
// ---------------------------------------------------------------------------

bool DatabaseManager::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS sessions (
            id TEXT PRIMARY KEY,
            created_at INTEGER NOT NULL,
            completed_at INTEGER,
            status TEXT DEFAULT 'recording',
            source_path TEXT,
            duration_ms INTEGER,
            transcript TEXT
        );
        CREATE TABLE IF NOT EXISTS chunk_results (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            chunk_id TEXT NOT NULL,
            sequence_number INTEGER NOT NULL,
            status TEXT NOT NULL,
            confidence REAL,
            error TEXT,
            error_kind TEXT,
            processing_time_ms INTEGER,
            created_at INTEGER NOT NULL,
            UNIQUE (session_id, chunk_id),
            FOREIGN KEY (session_id) REFERENCES sessions(id)
        );
        CREATE TABLE IF NOT EXISTS segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            result_id INTEGER NOT NULL,
            segment_index INTEGER NOT NULL,
            start_time REAL NOT NULL,
            end_time REAL NOT NULL,
            text TEXT NOT NULL,
            confidence REAL,
            speaker TEXT,
            FOREIGN KEY (result_id) REFERENCES chunk_results(id) ON DELETE CASCADE
        );
        CREATE INDEX IF NOT EXISTS idx_results_session
            ON chunk_results(session_id, sequence_number);
        CREATE INDEX IF NOT EXISTS idx_segments_result
            ON segments(result_id, segment_index);
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        CS_LOG_ERROR(std::string("Schema creation failed: ") + (err ? err : "unknown error"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Session operations
// ---------------------------------------------------------------------------

std::string DatabaseManager::create_session(const std::string& source_path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return "";

    std::string id = generate_uuid();

    Transaction txn(db_);
    if (!txn.ok()) return "";

    const char* sql =
        "INSERT INTO sessions (id, created_at, status, source_path) "
        "VALUES (?, ?, 'recording', ?)";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return "";

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, now_unix());
    sqlite3_bind_text(stmt, 3, source_path.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        log_sqlite_error(db_, "insert session");
        return "";
    }

    if (!txn.commit()) return "";
    return id;
}

bool DatabaseManager::update_transcript(const std::string& session_id,
                                        const std::string& transcript,
                                        int64_t duration_ms) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    const char* sql =
        "UPDATE sessions SET transcript = ?, duration_ms = ?, "
        "status = 'complete', completed_at = ? WHERE id = ?";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;

    sqlite3_bind_text(stmt, 1, transcript.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, duration_ms);
    sqlite3_bind_int64(stmt, 3, now_unix());
    sqlite3_bind_text(stmt, 4, session_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        log_sqlite_error(db_, "update transcript");
        return false;
    }

    return txn.commit();
}

bool DatabaseManager::mark_failed(const std::string& session_id) {
    return update_status(session_id, RecordingStatus::failed);
}

bool DatabaseManager::update_status(const std::string& session_id,
                                    RecordingStatus status) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    const char* sql = "UPDATE sessions SET status = ? WHERE id = ?";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;

    sqlite3_bind_text(stmt, 1, status_to_string(status), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        log_sqlite_error(db_, "update status");
        return false;
    }

    return txn.commit();
}

bool DatabaseManager::update_duration(const std::string& session_id,
                                      int64_t duration_ms) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    const char* sql = "UPDATE sessions SET duration_ms = ? WHERE id = ?";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;

    sqlite3_bind_int64(stmt, 1, duration_ms);
    sqlite3_bind_text(stmt, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        log_sqlite_error(db_, "update duration");
        return false;
    }
    return true;
}

std::optional<RecordingSession> DatabaseManager::get_session(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    std::string sql = std::string(kSessionColumns) + "WHERE id = ?";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) return std::nullopt;

    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;
    return read_session(stmt);
}

std::vector<RecordingSession> DatabaseManager::get_sessions() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return {};
    return read_sessions(db_, "ORDER BY created_at DESC");
}

std::vector<RecordingSession> DatabaseManager::get_orphaned_sessions() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return {};
    return read_sessions(db_,
        "WHERE status IN ('recording', 'transcribing') ORDER BY created_at DESC");
}

bool DatabaseManager::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    // Children first (foreign keys).
    if (!exec_for_session(db_,
            "DELETE FROM segments WHERE result_id IN "
            "(SELECT id FROM chunk_results WHERE session_id = ?)", session_id)) {
        return false;
    }
    if (!exec_for_session(db_, "DELETE FROM chunk_results WHERE session_id = ?", session_id)) {
        return false;
    }
    if (!exec_for_session(db_, "DELETE FROM sessions WHERE id = ?", session_id)) {
        return false;
    }

    return txn.commit();
}

// ---------------------------------------------------------------------------
// Chunk result operations
// ---------------------------------------------------------------------------

bool DatabaseManager::save_chunk_result(const std::string& session_id,
                                        const ChunkResult& result) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    // Replace: drop the previous row and its segments.
    {
        const char* sql =
            "DELETE FROM segments WHERE result_id IN "
            "(SELECT id FROM chunk_results WHERE session_id = ? AND chunk_id = ?)";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, result.chunk_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            log_sqlite_error(db_, "delete segments");
            return false;
        }
    }
    {
        const char* sql = "DELETE FROM chunk_results WHERE session_id = ? AND chunk_id = ?";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, result.chunk_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            log_sqlite_error(db_, "delete chunk result");
            return false;
        }
    }

    sqlite3_int64 result_id = 0;
    {
        const char* sql =
            "INSERT INTO chunk_results (session_id, chunk_id, sequence_number, status, "
            "confidence, error, error_kind, processing_time_ms, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;

        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, result.chunk_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, result.sequence_number);
        sqlite3_bind_text(stmt, 4, chunk_status_to_string(result.status), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 5, result.confidence);
        sqlite3_bind_text(stmt, 6, result.error.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, error_kind_to_string(result.error_kind), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 8, result.processing_time_ms);
        sqlite3_bind_int64(stmt, 9, now_unix());

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            log_sqlite_error(db_, "insert chunk result");
            return false;
        }
        result_id = sqlite3_last_insert_rowid(db_);
    }

    {
        const char* sql =
            "INSERT INTO segments (result_id, segment_index, start_time, end_time, "
            "text, confidence, speaker) VALUES (?, ?, ?, ?, ?, ?, ?)";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;

        int index = 0;
        for (const auto& seg : result.segments) {
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            sqlite3_bind_int64(stmt, 1, result_id);
            sqlite3_bind_int(stmt, 2, index++);
            sqlite3_bind_double(stmt, 3, seg.start);
            sqlite3_bind_double(stmt, 4, seg.end);
            sqlite3_bind_text(stmt, 5, seg.text.c_str(), -1, SQLITE_TRANSIENT);
            if (seg.confidence) {
                sqlite3_bind_double(stmt, 6, *seg.confidence);
            } else {
                sqlite3_bind_null(stmt, 6);
            }
            sqlite3_bind_text(stmt, 7, seg.speaker.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                log_sqlite_error(db_, "insert segment");
                return false;
            }
        }
    }

    return txn.commit();
}

std::vector<ChunkResult> DatabaseManager::get_chunk_results(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ChunkResult> results;
    if (!db_) return results;

    const char* sql =
        "SELECT id, chunk_id, sequence_number, status, confidence, error, error_kind, "
        "processing_time_ms FROM chunk_results WHERE session_id = ? "
        "ORDER BY sequence_number ASC, id ASC";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return results;

    const char* seg_sql =
        "SELECT start_time, end_time, text, confidence, speaker FROM segments "
        "WHERE result_id = ? ORDER BY segment_index ASC";
    Statement seg_stmt(db_, seg_sql);
    if (!seg_stmt.ok()) return results;

    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sqlite3_int64 result_id = sqlite3_column_int64(stmt, 0);

        ChunkResult r;
        r.chunk_id           = column_string(stmt, 1);
        r.sequence_number    = sqlite3_column_int(stmt, 2);
        r.status             = chunk_status_from_string(column_string(stmt, 3));
        r.confidence         = sqlite3_column_double(stmt, 4);
        r.error              = column_string(stmt, 5);
        r.error_kind         = error_kind_from_string(column_string(stmt, 6));
        r.processing_time_ms = column_int64_or_zero(stmt, 7);

        sqlite3_reset(seg_stmt);
        sqlite3_bind_int64(seg_stmt, 1, result_id);
        while (sqlite3_step(seg_stmt) == SQLITE_ROW) {
            TranscriptionSegment seg;
            seg.start = sqlite3_column_double(seg_stmt, 0);
            seg.end   = sqlite3_column_double(seg_stmt, 1);
            seg.text  = column_string(seg_stmt, 2);
            if (sqlite3_column_type(seg_stmt, 3) != SQLITE_NULL) {
                seg.confidence = sqlite3_column_double(seg_stmt, 3);
            }
            seg.speaker = column_string(seg_stmt, 4);
            r.segments.push_back(std::move(seg));
        }

        results.push_back(std::move(r));
    }

    return results;
}

// ---------------------------------------------------------------------------
// Utility
// ---------------------------------------------------------------------------

std::string DatabaseManager::generate_uuid() {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, 15);

    const char* hex = "0123456789abcdef";
    // 8-4-4-4-12
    constexpr int kPattern[] = {
        8, -1, 4, -1, 4, -1, 4, -1, 12
    };

    std::string uuid;
    uuid.reserve(36);

    for (int group : kPattern) {
        if (group == -1) {
            uuid += '-';
        } else {
            for (int i = 0; i < group; ++i) {
                uuid += hex[dist(rng)];
            }
        }
    }

    // Version 4, variant 8/9/a/b.
    uuid[14] = '4';
    uuid[19] = hex[(dist(rng) & 0x3) | 0x8];

    return uuid;
}

int64_t DatabaseManager::now_unix() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace cs
