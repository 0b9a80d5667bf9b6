#include "SessionManager.hpp"

#include "Logger.hpp"
#include "TranscriptWriter.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace cs {

namespace {

constexpr auto kDrainPoll = std::chrono::seconds(5);

std::string plain_text(const std::vector<TranscriptionSegment>& segments,
                       const std::string& silence_text) {
    std::string text;
    for (const auto& s : segments) {
        if (s.text == silence_text) continue;
        if (!text.empty()) text += ' ';
        text += s.text;
    }
    return text;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

SessionManager::SessionManager(PipelineConfig config, TranscriptionService* service)
    : config_(std::move(config)),
      db_(config_.database_path),
      service_(service ? service : &whisper_),
      consolidator_(config_.consolidation) {}

SessionManager::~SessionManager() {
    if (is_active()) {
        stop_session();
    }
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

bool SessionManager::init() {
    if (!db_.open()) {
        CS_LOG_ERROR("Cannot open session database " + db_.path());
        return false;
    }

    if (service_ == &whisper_) {
        if (config_.model_path.empty()) {
            CS_LOG_WARNING("No whisper model configured; chunks will fail until one is loaded");
        } else if (!whisper_.load(config_.model_path, config_.whisper)) {
            CS_LOG_ERROR("Failed to load whisper model " + config_.model_path);
        } else {
            CS_LOG_INFO("Whisper model loaded: " + config_.model_path);
        }
    }

    recover_orphaned_sessions();
    return true;
}

// ---------------------------------------------------------------------------
// start_session
// ---------------------------------------------------------------------------

std::string SessionManager::start_session(const std::string& directory,
                                          const std::string& output_path) {
    std::lock_guard<std::mutex> lock(mu_);

    if (!current_session_id_.empty()) {
        CS_LOG_WARNING("A session is already active: " + current_session_id_);
        return "";
    }

    std::string session_id = db_.create_session(directory);
    if (session_id.empty()) {
        return "";
    }

    current_session_id_ = session_id;
    current_directory_ = directory;
    current_output_path_ = output_path.empty() ? default_output_path(directory) : output_path;
    recorded_until_ = 0.0;
    chunk_files_.clear();

    realtime_ = std::make_unique<RealtimeTextManager>(config_.realtime);
    queue_ = std::make_unique<TranscriptionQueue>(*service_, config_.queue);
    queue_->add_observer(this);
    queue_->add_observer(realtime_.get());

    WatcherConfig watcher_config = config_.watcher;
    watcher_config.directory = directory;
    watcher_ = std::make_unique<ChunkWatcher>(watcher_config);
    watcher_->add_observer(this);

    realtime_->start(RealtimeTextManager::output_path_for(current_output_path_));
    queue_->start();
    watcher_->start();

    CS_LOG_INFO("Session " + session_id + " started on " + directory);
    return session_id;
}

// ---------------------------------------------------------------------------
// stop_session
// ---------------------------------------------------------------------------

bool SessionManager::stop_session() {
    std::string session_id;
    std::string directory;
    std::string output_path;
    ChunkWatcher* watcher = nullptr;
    TranscriptionQueue* queue = nullptr;
    RealtimeTextManager* realtime = nullptr;

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (current_session_id_.empty()) return false;
        session_id = current_session_id_;
        directory = current_directory_;
        output_path = current_output_path_;
        watcher = watcher_.get();
        queue = queue_.get();
        realtime = realtime_.get();
    }

    // The tail of each live recording is queued by on_audio_chunk() here.
    watcher->finish();
    db_.update_status(session_id, RecordingStatus::transcribing);

    while (!queue->wait_idle(kDrainPoll)) {
        QueueStats stats = queue->get_stats();
        CS_LOG_INFO("Waiting for " + std::to_string(stats.pending + stats.processing) +
                    " chunk(s) to finish");
    }
    queue->stop();

    QueueStats stats = queue->get_stats();
    if (stats.halted) {
        CS_LOG_WARNING("Session " + session_id + " stopped early: transcription service unreachable");
    }

    realtime->set_total_chunks(stats.total);
    realtime->stop();

    double duration = 0.0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        duration = recorded_until_;
        watcher_.reset();
        queue_.reset();
        realtime_.reset();
        current_session_id_.clear();
        current_directory_.clear();
        current_output_path_.clear();
        chunk_files_.clear();
    }

    std::optional<double> known_duration;
    if (duration > 0) known_duration = duration;

    return finalize(session_id, directory, output_path,
                    db_.get_chunk_results(session_id), known_duration);
}

bool SessionManager::is_active() const {
    std::lock_guard<std::mutex> lock(mu_);
    return !current_session_id_.empty();
}

std::string SessionManager::current_session_id() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_session_id_;
}

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

void SessionManager::on_chunk_file(const ChunkFileInfo& info) {
    CS_LOG_DEBUG("Chunk file ready: " + info.full_path);
}

void SessionManager::on_audio_chunk(const AudioChunk& chunk) {
    std::string session_id;
    double recorded = 0.0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!queue_) return;

        recorded_until_ = std::max(recorded_until_, chunk.end_time);
        if (!chunk.source_file_path.empty()) {
            chunk_files_[chunk.id] =
                std::filesystem::path(chunk.source_file_path).filename().string();
        }
        queue_->enqueue(chunk);
        session_id = current_session_id_;
        recorded = recorded_until_;
    }

    // Recovery after a crash consolidates against the recorded length.
    if (!db_.update_duration(session_id, static_cast<int64_t>(recorded * 1000.0))) {
        CS_LOG_WARNING("Failed to store duration for session " + session_id);
    }
}

void SessionManager::on_chunk_result(const ChunkResult& result) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mu_);
        session_id = current_session_id_;

        auto it = chunk_files_.find(result.chunk_id);
        if (it != chunk_files_.end() && watcher_ && result.status == ChunkStatus::completed) {
            watcher_->mark_processed(it->second);
        }
    }
    if (session_id.empty()) return;

    if (!db_.save_chunk_result(session_id, result)) {
        CS_LOG_ERROR("Failed to store result for chunk " + result.chunk_id);
    }
    if (result.status == ChunkStatus::failed) {
        CS_LOG_WARNING(result.error);
    }
}

// ---------------------------------------------------------------------------
// consolidate_session / finalize
// ---------------------------------------------------------------------------

bool SessionManager::consolidate_session(const std::string& session_id,
                                         const std::string& output_path) {
    auto session = db_.get_session(session_id);
    if (!session) {
        CS_LOG_ERROR("Unknown session " + session_id);
        return false;
    }

    std::string out = output_path.empty() ? default_output_path(session->source_path)
                                          : output_path;

    std::optional<double> duration;
    if (session->duration_ms > 0) {
        duration = static_cast<double>(session->duration_ms) / 1000.0;
    }

    return finalize(session_id, session->source_path, out,
                    db_.get_chunk_results(session_id), duration);
}

bool SessionManager::finalize(const std::string& session_id,
                              const std::string& source_path,
                              const std::string& output_path,
                              const std::vector<ChunkResult>& results,
                              std::optional<double> duration) {
    ConsolidatedTranscript transcript =
        consolidator_.consolidate(results, duration, source_path, config_.whisper.language);

    if (transcript.stats.processed_chunks == 0) {
        CS_LOG_ERROR("Session " + session_id + ": no chunk was transcribed");
        db_.mark_failed(session_id);
        return false;
    }

    std::string content = format_transcript(transcript.metadata, transcript.segments,
                                            config_.timestamped_output);
    if (!write_text_file(output_path, content)) {
        CS_LOG_ERROR("Failed to write transcript " + output_path);
        db_.mark_failed(session_id);
        return false;
    }

    auto duration_ms = static_cast<int64_t>(transcript.metadata.duration * 1000.0);
    if (!db_.update_transcript(session_id,
                               plain_text(transcript.segments,
                                          consolidator_.settings().silence_text),
                               duration_ms)) {
        CS_LOG_ERROR("Failed to store transcript for session " + session_id);
    }

    CS_LOG_INFO("Transcript written: " + output_path + " (" +
                std::to_string(transcript.metadata.segment_count) + " segment(s), " +
                std::to_string(static_cast<int>(transcript.stats.coverage_percentage)) +
                "% coverage)");
    return true;
}

// ---------------------------------------------------------------------------
// Data access (delegates)
// ---------------------------------------------------------------------------

std::vector<RecordingSession> SessionManager::get_sessions() const {
    return db_.get_sessions();
}

std::optional<RecordingSession> SessionManager::get_session(const std::string& id) const {
    return db_.get_session(id);
}

bool SessionManager::delete_session(const std::string& id) {
    if (id == current_session_id()) {
        CS_LOG_WARNING("Cannot delete the active session " + id);
        return false;
    }
    return db_.delete_session(id);
}

std::string SessionManager::default_output_path(const std::string& source_path) {
    if (source_path.empty()) return "transcript.txt";

    std::error_code ec;
    std::filesystem::path p(source_path);
    if (std::filesystem::is_directory(p, ec)) {
        return (p / "transcript.txt").string();
    }
    p.replace_extension(".txt");
    return p.string();
}

// ---------------------------------------------------------------------------
// recover_orphaned_sessions
// ---------------------------------------------------------------------------

void SessionManager::recover_orphaned_sessions() {
    std::vector<RecordingSession> orphaned = db_.get_orphaned_sessions();

    for (const auto& session : orphaned) {
        if (session.id == current_session_id()) continue;

        CS_LOG_INFO("Recovering interrupted session " + session.id);
        db_.update_status(session.id, RecordingStatus::transcribing);

        // consolidate_session marks the session failed if nothing was stored.
        consolidate_session(session.id);
    }
}

} // namespace cs
