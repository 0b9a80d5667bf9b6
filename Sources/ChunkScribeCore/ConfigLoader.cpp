#include "ConfigLoader.hpp"

#include "Logger.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cs {

namespace {

void apply(const json& j, PipelineConfig& c) {
    ExtractorConfig& ex = c.watcher.extractor;
    ex.interval_seconds = j.value("chunkIntervalSeconds", ex.interval_seconds);
    c.realtime.chunk_interval_seconds = ex.interval_seconds;

    c.watcher.interval_ms        = j.value("watchIntervalMs", c.watcher.interval_ms);
    c.watcher.stability_delay_ms = j.value("stabilityDelayMs", c.watcher.stability_delay_ms);
    c.watcher.min_file_size      = j.value("minFileSize", c.watcher.min_file_size);

    c.queue.max_concurrency = j.value("maxConcurrency", c.queue.max_concurrency);
    c.queue.max_retries     = j.value("maxRetries", c.queue.max_retries);
    c.queue.temp_dir        = j.value("tempDir", c.queue.temp_dir);

    ConsolidationSettings& cons = c.consolidation;
    cons.overlap_threshold      = j.value("overlapThreshold", cons.overlap_threshold);
    cons.quality_threshold      = j.value("qualityThreshold", cons.quality_threshold);
    cons.enable_text_smoothing  = j.value("enableTextSmoothing", cons.enable_text_smoothing);
    cons.enable_time_adjustment = j.value("enableTimeAdjustment", cons.enable_time_adjustment);
    cons.max_gap_fill           = j.value("maxGapFill", cons.max_gap_fill);

    c.realtime.write_interval_ms = j.value("writeInterval", c.realtime.write_interval_ms);
    c.realtime.buffer_size       = j.value("bufferSize", c.realtime.buffer_size);
    std::string format = j.value("fileFormat", std::string("detailed"));
    if (format == "simple") {
        c.realtime.file_format = RealtimeFileFormat::simple;
    } else if (format == "detailed") {
        c.realtime.file_format = RealtimeFileFormat::detailed;
    } else {
        CS_LOG_WARNING("Unknown fileFormat '" + format + "', using detailed");
        c.realtime.file_format = RealtimeFileFormat::detailed;
    }

    c.timestamped_output = j.value("timestampedOutput", c.timestamped_output);
    c.model_path         = j.value("modelPath", c.model_path);
    c.whisper.language   = j.value("language", c.whisper.language);
    c.whisper.threads    = j.value("threads", c.whisper.threads);
    c.database_path      = j.value("databasePath", c.database_path);
    c.log_file           = j.value("logFile", c.log_file);
    c.log_level          = j.value("logLevel", c.log_level);
}

} // namespace

PipelineConfig ConfigLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        CS_LOG_WARNING("Cannot open config file " + path + ", using defaults");
        return {};
    }

    try {
        json j;
        file >> j;
        PipelineConfig config;
        cs::apply(j, config);
        CS_LOG_INFO("Config loaded: " + path);
        return config;
    } catch (const json::exception& e) {
        CS_LOG_WARNING("Failed to parse " + path + ": " + e.what() + "; using defaults");
        return {};
    }
}

PipelineConfig ConfigLoader::load_string(const std::string& text) {
    try {
        json j = json::parse(text);
        PipelineConfig config;
        cs::apply(j, config);
        return config;
    } catch (const json::exception& e) {
        CS_LOG_WARNING(std::string("Failed to parse config: ") + e.what() + "; using defaults");
        return {};
    }
}

} // namespace cs
