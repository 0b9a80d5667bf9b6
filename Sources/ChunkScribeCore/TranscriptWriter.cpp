#include "TranscriptWriter.hpp"

#include "Logger.hpp"

#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace cs {

std::string format_timestamp(double seconds) {
    if (seconds < 0) seconds = 0;
    int64_t tenths = static_cast<int64_t>(std::llround(seconds * 10.0));
    int64_t total_s = tenths / 10;

    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(2) << total_s / 3600 << ':'
       << std::setw(2) << (total_s / 60) % 60 << ':'
       << std::setw(2) << total_s % 60 << '.'
       << tenths % 10;
    return ss.str();
}

std::string format_iso8601(int64_t unix_ms) {
    std::time_t t = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << unix_ms % 1000 << 'Z';
    return ss.str();
}

std::string format_transcript(const TranscriptMetadata& metadata,
                              const std::vector<TranscriptionSegment>& segments,
                              bool timestamped) {
    std::ostringstream ss;
    ss << std::fixed;
    ss << "## Metadata\n"
       << "audio_file: " << metadata.audio_file << '\n'
       << "model: " << metadata.model << '\n'
       << "transcribed_at: " << metadata.transcribed_at << '\n'
       << "duration: " << std::setprecision(1) << metadata.duration << '\n'
       << "segment_count: " << metadata.segment_count << '\n'
       << "language: " << metadata.language << '\n'
       << "coverage: " << std::setprecision(1) << metadata.coverage << '\n'
       << "chunk_count: " << metadata.chunk_count << '\n'
       << "quality_score: " << std::setprecision(2) << metadata.quality_score << '\n'
       << '\n'
       << "## Transcript\n";

    if (timestamped) {
        for (const auto& seg : segments) {
            ss << '[' << format_timestamp(seg.start) << "] " << seg.text << '\n';
        }
    } else {
        std::string body;
        for (const auto& seg : segments) {
            if (!body.empty()) body += ' ';
            body += seg.text;
        }
        ss << body << '\n';
    }
    return ss.str();
}

bool write_text_file(const std::string& path, const std::string& content) {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            CS_LOG_ERROR("Cannot create directory for " + path + ": " + ec.message());
            return false;
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            CS_LOG_ERROR("Cannot open " + tmp.string() + " for writing");
            return false;
        }
        out << content;
        if (!out.good()) {
            CS_LOG_ERROR("Failed to write " + tmp.string());
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        CS_LOG_ERROR("Cannot replace " + path + ": " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace cs
