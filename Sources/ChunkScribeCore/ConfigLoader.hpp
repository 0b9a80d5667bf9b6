#pragma once

#include "ChunkWatcher.hpp"
#include "RealtimeTextManager.hpp"
#include "ResultConsolidator.hpp"
#include "TranscriptionQueue.hpp"
#include "WhisperEngine.hpp"

#include <string>

namespace cs {

/// Everything a pipeline run is configured with. The chunk interval lives in
/// watcher.extractor and is mirrored into realtime.chunk_interval_seconds.
struct PipelineConfig {
    WatcherConfig           watcher;
    QueueConfig             queue;
    ConsolidationSettings   consolidation;
    RealtimeTextConfig      realtime;
    WhisperSettings         whisper;

    bool        timestamped_output = true;
    std::string model_path;
    std::string database_path;      // empty: <watch dir>/chunkscribe.db
    std::string log_file;
    std::string log_level = "info";
};

/// JSON configuration file -> PipelineConfig.
///
/// Keys are camelCase ("chunkIntervalSeconds", "maxConcurrency", ...).
/// Missing keys keep their defaults. A file that cannot be read or parsed is
/// logged and yields the defaults.
class ConfigLoader {
public:
    static PipelineConfig load_file(const std::string& path);
    static PipelineConfig load_string(const std::string& text);
};

} // namespace cs
