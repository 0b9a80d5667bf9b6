#include "ChunkWatcher.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <system_error>

namespace cs {

namespace {

const std::regex kChunkPattern(
    R"(^(timerange_chunk_|truediff_chunk_|differential_chunk_)(\d{3})\.webm$)");
const std::regex kLivePattern(R"(^recording_.*\.webm$)");

ChunkNaming naming_from_prefix(const std::string& prefix) {
    if (prefix == "timerange_chunk_") return ChunkNaming::time_range;
    if (prefix == "truediff_chunk_")  return ChunkNaming::true_diff;
    return ChunkNaming::differential;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ChunkWatcher::ChunkWatcher(WatcherConfig config) : config_(std::move(config)) {}

ChunkWatcher::~ChunkWatcher() {
    stop();
}

void ChunkWatcher::add_observer(ChunkObserver* observer) {
    std::lock_guard<std::mutex> lock(mu_);
    if (observer) observers_.push_back(observer);
}

// ---------------------------------------------------------------------------
// parse_filename
// ---------------------------------------------------------------------------

std::optional<ChunkFileInfo> ChunkWatcher::parse_filename(const std::string& filename) {
    std::smatch m;
    if (std::regex_match(filename, m, kChunkPattern)) {
        ChunkFileInfo info;
        info.filename = filename;
        info.naming = naming_from_prefix(m[1].str());
        info.sequence_number = std::stoi(m[2].str());
        return info;
    }
    if (std::regex_match(filename, kLivePattern)) {
        ChunkFileInfo info;
        info.filename = filename;
        info.naming = ChunkNaming::live_recording;
        return info;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// start / stop / finish
// ---------------------------------------------------------------------------

bool ChunkWatcher::start() {
    if (running_.exchange(true)) {
        return false;
    }
    CS_LOG_INFO("Watching " + config_.directory + " every " +
                std::to_string(config_.interval_ms) + " ms");
    thread_ = std::thread(&ChunkWatcher::run, this);
    return true;
}

void ChunkWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ChunkWatcher::finish() {
    stop();

    std::vector<AudioChunk> chunks;
    {
        std::lock_guard<std::mutex> poll_lock(poll_mu_);
        for (auto& [name, live] : live_) {
            double elapsed = elapsed_since(live.first_seen);
            drain_live(live, elapsed, true, chunks);
        }
    }
    notify({}, chunks);
}

bool ChunkWatcher::is_watching() const {
    return running_;
}

void ChunkWatcher::run() {
    while (running_) {
        poll_once();

        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                     [this] { return !running_; });
    }
}

// ---------------------------------------------------------------------------
// poll_once
// ---------------------------------------------------------------------------

void ChunkWatcher::poll_once() {
    std::lock_guard<std::mutex> poll_lock(poll_mu_);

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.directory, ec);
    if (ec) {
        if (!missing_dir_logged_) {
            CS_LOG_WARNING("Cannot read watch directory " + config_.directory +
                           ": " + ec.message());
            missing_dir_logged_ = true;
        }
        return;
    }
    missing_dir_logged_ = false;

    std::vector<ChunkFileInfo> candidates;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        auto info = parse_filename(entry.path().filename().string());
        if (!info) continue;
        info->full_path = entry.path().string();
        candidates.push_back(std::move(*info));
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const ChunkFileInfo& a, const ChunkFileInfo& b) {
                  if (a.sequence_number != b.sequence_number)
                      return a.sequence_number < b.sequence_number;
                  return a.filename < b.filename;
              });

    std::vector<ChunkFileInfo> files;
    std::vector<AudioChunk> chunks;
    for (auto& info : candidates) {
        bool live = info.naming == ChunkNaming::live_recording;
        if (live && !config_.watch_live_recordings) continue;
        if (!claim_source(info)) continue;

        if (live) {
            poll_live(info, chunks);
        } else {
            scan_chunk_file(std::move(info), files, chunks);
        }
    }
    notify(files, chunks);
}

bool ChunkWatcher::claim_source(const ChunkFileInfo& info) {
    bool live = info.naming == ChunkNaming::live_recording;

    if (source_ == Source::none) {
        source_ = live ? Source::live_recording : Source::chunk_files;
        if (live) {
            live_name_ = info.filename;
            CS_LOG_INFO("Following live recording " + info.filename);
        } else {
            CS_LOG_INFO("Following chunk files in " + config_.directory);
        }
        return true;
    }

    if (live ? (source_ == Source::live_recording && live_name_ == info.filename)
             : source_ == Source::chunk_files) {
        return true;
    }

    if (ignored_.insert(info.filename).second) {
        CS_LOG_WARNING("Ignoring " + info.filename + ": already following " +
                       (source_ == Source::live_recording ? live_name_
                                                          : std::string("chunk files")));
    }
    return false;
}

void ChunkWatcher::scan_chunk_file(ChunkFileInfo info,
                                   std::vector<ChunkFileInfo>& files,
                                   std::vector<AudioChunk>& chunks) {
    FileByteSource source(info.full_path);
    auto size = source.size();
    if (!size) return;

    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = detected_.find(info.filename);
        if (it != detected_.end() && it->second.size == *size) {
            return;     // same identity, already reported
        }
    }

    if (!check_stability(source, config_.stability_delay_ms, config_.min_file_size)) {
        return;
    }

    size = source.size();
    if (!size) return;
    webm::Bytes bytes = source.read(0, static_cast<size_t>(*size));
    if (bytes.size() != *size) {
        CS_LOG_ERROR("Failed to read chunk file " + info.full_path);
        return;
    }

    info.size = *size;
    info.detected_at = unix_time_ms();
    info.is_ready = true;

    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = detected_.find(info.filename);
        if (it != detected_.end()) {
            // Rewritten file: it has to be processed again.
            processed_.erase(info.filename);
            CS_LOG_INFO("Chunk file changed: " + info.filename + " (" +
                        std::to_string(it->second.size) + " -> " +
                        std::to_string(info.size) + " bytes)");
        } else {
            CS_LOG_INFO("Chunk file detected: " + info.filename + " (" +
                        std::to_string(info.size) + " bytes)");
        }
        detected_[info.filename] = info;
    }

    // Chunk files are numbered from 001: file N covers [(N-1)*interval, N*interval).
    const double interval = config_.extractor.interval_seconds;
    AudioChunk chunk;
    chunk.id = std::filesystem::path(info.filename).stem().string();
    chunk.sequence_number = info.sequence_number;
    chunk.start_time = std::max(0, info.sequence_number - 1) * interval;
    chunk.end_time = chunk.start_time + interval;
    chunk.audio_data = std::move(bytes);
    chunk.sample_rate = config_.extractor.sample_rate;
    chunk.channels = config_.extractor.channels;
    chunk.source_file_path = info.full_path;

    files.push_back(info);
    chunks.push_back(std::move(chunk));
}

void ChunkWatcher::poll_live(const ChunkFileInfo& info, std::vector<AudioChunk>& chunks) {
    auto it = live_.find(info.filename);
    if (it == live_.end()) {
        LiveRecording live;
        live.source = std::make_unique<FileByteSource>(info.full_path);
        std::string id = std::filesystem::path(info.filename).stem().string();
        live.extractor = std::make_unique<ChunkExtractor>(id, config_.extractor);
        live.first_seen = std::chrono::steady_clock::now();
        it = live_.emplace(info.filename, std::move(live)).first;
        CS_LOG_INFO("Live recording detected: " + info.filename);
    }

    drain_live(it->second, elapsed_since(it->second.first_seen), false, chunks);
}

void ChunkWatcher::drain_live(LiveRecording& live, double elapsed, bool final,
                              std::vector<AudioChunk>& chunks) {
    // One slice per tick; a late tick yields one longer chunk.
    ExtractResult r = live.extractor->poll(*live.source, elapsed);
    if (r.status == ExtractStatus::emitted) {
        chunks.push_back(std::move(*r.chunk));
    }
    if (final) {
        ExtractResult tail = live.extractor->flush(*live.source, elapsed);
        if (tail.status == ExtractStatus::emitted) {
            chunks.push_back(std::move(*tail.chunk));
        } else if (!tail.detail.empty()) {
            CS_LOG_DEBUG("No tail chunk for " + live.source->name() + ": " + tail.detail);
        }
    }
}

void ChunkWatcher::notify(const std::vector<ChunkFileInfo>& files,
                          const std::vector<AudioChunk>& chunks) {
    std::vector<ChunkObserver*> observers;
    {
        std::lock_guard<std::mutex> lock(mu_);
        observers = observers_;
    }
    for (const auto& f : files) {
        for (auto* o : observers) o->on_chunk_file(f);
    }
    for (const auto& c : chunks) {
        for (auto* o : observers) o->on_audio_chunk(c);
    }
}

double ChunkWatcher::elapsed_since(std::chrono::steady_clock::time_point t) const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t).count();
}

// ---------------------------------------------------------------------------
// Bookkeeping
// ---------------------------------------------------------------------------

void ChunkWatcher::mark_processed(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mu_);
    processed_.insert(filename);
}

std::vector<ChunkFileInfo> ChunkWatcher::get_pending_files() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ChunkFileInfo> pending;
    for (const auto& [name, info] : detected_) {
        if (!processed_.count(name)) pending.push_back(info);
    }
    std::sort(pending.begin(), pending.end(),
              [](const ChunkFileInfo& a, const ChunkFileInfo& b) {
                  return a.sequence_number < b.sequence_number;
              });
    return pending;
}

WatcherStats ChunkWatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    WatcherStats s;
    s.total_detected = static_cast<int>(detected_.size());
    s.total_processed = 0;
    for (const auto& name : processed_) {
        if (detected_.count(name)) ++s.total_processed;
    }
    s.pending_count = s.total_detected - s.total_processed;
    s.is_watching = running_;
    return s;
}

} // namespace cs
