#include "ChunkExtractor.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <thread>

namespace cs {

namespace {

std::string make_chunk_id(const std::string& recording_id, int32_t sequence) {
    std::ostringstream ss;
    ss << recording_id << "_chunk_" << std::setw(3) << std::setfill('0') << sequence;
    return ss.str();
}

/// A header-prefixed chunk is usable if its header parses and a Cluster
/// follows it.
bool validate_prefixed(const webm::Bytes& chunk, size_t header_len, size_t window) {
    return webm::is_parseable_header(chunk) &&
           webm::find_element(chunk, webm::kClusterId, window, header_len).has_value();
}

/// Raw bytes are usable only if they already start a container or a Cluster.
bool validate_raw(const webm::Bytes& chunk) {
    if (webm::has_ebml_signature(chunk)) {
        return webm::is_parseable_header(chunk);
    }
    auto el = webm::read_element_header(chunk, 0);
    return el && el->id == webm::kClusterId;
}

} // namespace

// ---------------------------------------------------------------------------
// FileByteSource
// ---------------------------------------------------------------------------

FileByteSource::FileByteSource(std::string path) : path_(std::move(path)) {}

std::optional<uint64_t> FileByteSource::size() const {
    std::error_code ec;
    auto sz = std::filesystem::file_size(path_, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(sz);
}

webm::Bytes FileByteSource::read(uint64_t offset, size_t length) const {
    webm::Bytes out;
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) return out;

    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) return out;

    out.resize(length);
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
    out.resize(static_cast<size_t>(in.gcount()));
    return out;
}

// ---------------------------------------------------------------------------
// MemoryByteSource
// ---------------------------------------------------------------------------

MemoryByteSource::MemoryByteSource(std::string name) : name_(std::move(name)) {}

void MemoryByteSource::append(const webm::Bytes& bytes) {
    std::lock_guard<std::mutex> lock(mu_);
    data_.insert(data_.end(), bytes.begin(), bytes.end());
}

std::optional<uint64_t> MemoryByteSource::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<uint64_t>(data_.size());
}

webm::Bytes MemoryByteSource::read(uint64_t offset, size_t length) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (offset >= data_.size()) return {};
    size_t end = static_cast<size_t>(std::min<uint64_t>(data_.size(), offset + length));
    return webm::Bytes(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                       data_.begin() + static_cast<std::ptrdiff_t>(end));
}

// ---------------------------------------------------------------------------
// check_stability
// ---------------------------------------------------------------------------

bool check_stability(const ByteSource& source, int delay_ms, uint64_t min_size) {
    auto first = source.size();
    if (!first) return false;

    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    auto second = source.size();
    if (!second) return false;
    return *first == *second && *second >= min_size;
}

const char* strategy_to_string(HeaderStrategy s) {
    switch (s) {
        case HeaderStrategy::real_header:    return "real_header";
        case HeaderStrategy::minimal_header: return "minimal_header";
        case HeaderStrategy::raw:            return "raw";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ChunkExtractor
// ---------------------------------------------------------------------------

ChunkExtractor::ChunkExtractor(std::string recording_id, ExtractorConfig config)
    : recording_id_(std::move(recording_id)), config_(std::move(config)) {}

ExtractResult ChunkExtractor::poll(const ByteSource& source, double elapsed_seconds) {
    return extract(source, elapsed_seconds, false);
}

ExtractResult ChunkExtractor::flush(const ByteSource& source, double elapsed_seconds) {
    return extract(source, elapsed_seconds, true);
}

bool ChunkExtractor::ensure_header(const ByteSource& source, uint64_t size) {
    if (!header_.empty() || header_invalid_) return true;

    size_t window = config_.header_search_window;
    webm::Bytes leading = source.read(0, static_cast<size_t>(std::min<uint64_t>(size, window)));
    webm::HeaderResult r = webm::extract_header_prefix(leading, window);

    switch (r.status) {
        case webm::HeaderStatus::ok:
            header_ = std::move(r.header);
            CS_LOG_DEBUG("Captured " + std::to_string(header_.size()) +
                         "-byte header from " + source.name());
            return true;
        case webm::HeaderStatus::insufficient_data:
            return false;
        case webm::HeaderStatus::invalid_container:
            header_invalid_ = true;
            CS_LOG_WARNING("No usable WebM header in " + source.name() +
                           "; later chunks use fallback strategies");
            return true;
    }
    return false;
}

ExtractResult ChunkExtractor::extract(const ByteSource& source,
                                      double elapsed_seconds,
                                      bool final) {
    ExtractResult result;

    auto size = source.size();
    if (!size) {
        result.detail = "source size unavailable";
        return result;
    }
    if (*size <= last_offset_) {
        result.detail = "no new data";
        return result;
    }
    if (!ensure_header(source, *size) && next_sequence_ == 0) {
        result.detail = "header incomplete";
        return result;
    }

    const double interval = config_.interval_seconds;
    const double start = last_end_;
    double end = start + interval;

    if (final) {
        end = elapsed_seconds;
    } else if (elapsed_seconds < end) {
        result.detail = "interval not reached";
        return result;
    } else if (elapsed_seconds - end >= interval) {
        // Late tick: the slice holds everything recorded up to now.
        CS_LOG_DEBUG("Late poll for chunk " + std::to_string(next_sequence_) + " of " +
                     source.name() + "; chunk ends at " + std::to_string(elapsed_seconds) + " s");
        end = elapsed_seconds;
    }

    if (end - start < config_.min_chunk_seconds) {
        result.status = ExtractStatus::rejected;
        result.detail = "chunk shorter than minimum duration";
        CS_LOG_DEBUG("Rejected chunk " + std::to_string(next_sequence_) + " of " +
                     source.name() + ": " + result.detail);
        return result;
    }

    uint64_t available = *size - last_offset_;
    webm::Bytes slice = source.read(last_offset_, static_cast<size_t>(available));
    if (slice.empty()) {
        result.status = ExtractStatus::rejected;
        result.detail = "empty payload";
        return result;
    }

    AudioChunk chunk;
    if (next_sequence_ == 0) {
        chunk.audio_data = std::move(slice);
        chunk.kind = header_invalid_ ? ChunkKind::estimated : ChunkKind::normal;
    } else if (auto assembled = assemble(slice)) {
        chunk = std::move(*assembled);
    } else {
        CS_LOG_WARNING("All header strategies failed for chunk " +
                       std::to_string(next_sequence_) + " of " + source.name() +
                       "; emitting placeholder");
        chunk.kind = ChunkKind::live_placeholder;
    }

    chunk.id = make_chunk_id(recording_id_, next_sequence_);
    chunk.sequence_number = next_sequence_;
    chunk.start_time = start;
    chunk.end_time = end;
    chunk.sample_rate = config_.sample_rate;
    chunk.channels = config_.channels;

    last_offset_ = last_offset_ + static_cast<uint64_t>(available);
    last_end_ = end;
    ++next_sequence_;

    result.status = ExtractStatus::emitted;
    result.chunk = std::move(chunk);
    return result;
}

std::optional<AudioChunk> ChunkExtractor::assemble(const webm::Bytes& slice) const {
    const size_t window = config_.header_search_window;

    for (HeaderStrategy strategy : config_.strategies) {
        webm::Bytes out;
        ChunkKind kind = ChunkKind::estimated;
        bool valid = false;

        switch (strategy) {
            case HeaderStrategy::real_header:
                if (header_.empty()) break;
                out = header_;
                out.insert(out.end(), slice.begin(), slice.end());
                out = webm::rebase_cluster_timecode(out);
                valid = validate_prefixed(out, header_.size(), window);
                kind = ChunkKind::normal;
                break;
            case HeaderStrategy::minimal_header: {
                webm::Bytes minimal = webm::synthesize_minimal_header();
                out = minimal;
                out.insert(out.end(), slice.begin(), slice.end());
                out = webm::rebase_cluster_timecode(out);
                valid = validate_prefixed(out, minimal.size(), window);
                break;
            }
            case HeaderStrategy::raw:
                out = slice;
                valid = validate_raw(out);
                if (valid) {
                    CS_LOG_WARNING("Using raw bytes for chunk " +
                                   std::to_string(next_sequence_) + " (degraded)");
                }
                break;
        }

        if (valid) {
            AudioChunk chunk;
            chunk.audio_data = std::move(out);
            chunk.kind = kind;
            return chunk;
        }
        CS_LOG_DEBUG(std::string("Header strategy ") + strategy_to_string(strategy) +
                     " failed for chunk " + std::to_string(next_sequence_));
    }
    return std::nullopt;
}

} // namespace cs
