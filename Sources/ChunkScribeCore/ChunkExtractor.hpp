#pragma once

#include "EbmlCodec.hpp"
#include "Types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cs {

// ---------------------------------------------------------------------------
// Byte sources
// ---------------------------------------------------------------------------

/// Read access to a recording that may still be growing.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Current size in bytes, or nullopt if the source cannot be inspected.
    virtual std::optional<uint64_t> size() const = 0;

    /// Up to `length` bytes starting at `offset`. Short reads are allowed.
    virtual webm::Bytes read(uint64_t offset, size_t length) const = 0;

    virtual std::string name() const = 0;
};

/// A recording on disk.
class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(std::string path);

    std::optional<uint64_t> size() const override;
    webm::Bytes read(uint64_t offset, size_t length) const override;
    std::string name() const override { return path_; }

private:
    std::string path_;
};

/// A recording held in memory, appended to by a producer thread.
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string name = "memory");

    void append(const webm::Bytes& bytes);

    std::optional<uint64_t> size() const override;
    webm::Bytes read(uint64_t offset, size_t length) const override;
    std::string name() const override { return name_; }

private:
    std::string         name_;
    webm::Bytes         data_;
    mutable std::mutex  mu_;
};

/// Sample the source size twice, `delay_ms` apart. Ready only if both
/// samples agree and the size is at least `min_size`.
bool check_stability(const ByteSource& source, int delay_ms, uint64_t min_size);

// ---------------------------------------------------------------------------
// ChunkExtractor
// ---------------------------------------------------------------------------

/// Ways to make a mid-recording byte range decodable on its own.
enum class HeaderStrategy {
    real_header,        // the recording's own header, DocType fixed
    minimal_header,     // synthesized EBML header + unknown-size Segment
    raw                 // the bytes as they are
};

const char* strategy_to_string(HeaderStrategy s);

struct ExtractorConfig {
    double      interval_seconds = 5.0;
    double      min_chunk_seconds = 1.0;
    size_t      header_search_window = webm::kDefaultSearchWindow;
    int         sample_rate = 48000;
    int         channels = 1;
    std::vector<HeaderStrategy> strategies = {
        HeaderStrategy::real_header,
        HeaderStrategy::minimal_header,
        HeaderStrategy::raw,
    };
};

enum class ExtractStatus {
    emitted,
    insufficient_data,  // nothing to do yet; offset unchanged
    rejected            // quality gate; offset unchanged
};

struct ExtractResult {
    ExtractStatus               status = ExtractStatus::insufficient_data;
    std::optional<AudioChunk>   chunk;
    std::string                 detail;
};

/// Turns "the recording grew" into self-contained AudioChunks.
///
/// Chunk 0 is the recording's leading bytes as written. Every later chunk is
/// the byte range [last_processed_offset, current_size), made decodable by the
/// first header strategy whose output validates. If none does, a zero-length
/// live_placeholder chunk is emitted so sequence numbers stay contiguous.
class ChunkExtractor {
public:
    explicit ChunkExtractor(std::string recording_id, ExtractorConfig config = {});

    // Non-copyable.
    ChunkExtractor(const ChunkExtractor&) = delete;
    ChunkExtractor& operator=(const ChunkExtractor&) = delete;

    /// Emit the next chunk once `elapsed_seconds` has reached the end of the
    /// next full interval. Each chunk starts where the previous one ended; a
    /// poll that arrives a full interval or more late ends the chunk at
    /// `elapsed_seconds`, since the slice holds all of that audio.
    ExtractResult poll(const ByteSource& source, double elapsed_seconds);

    /// Emit whatever remains after the recording stopped. The chunk ends at
    /// `elapsed_seconds`.
    ExtractResult flush(const ByteSource& source, double elapsed_seconds);

    uint64_t last_processed_offset() const { return last_offset_; }
    int32_t  next_sequence() const { return next_sequence_; }
    double   last_end_time() const { return last_end_; }
    bool     has_header() const { return !header_.empty(); }
    const webm::Bytes& header() const { return header_; }

private:
    ExtractResult extract(const ByteSource& source, double elapsed_seconds, bool final);

    /// Capture the header from the leading bytes. False while it is not yet
    /// complete.
    bool ensure_header(const ByteSource& source, uint64_t size);

    /// Apply the strategy chain to a slice. nullopt if every strategy failed.
    std::optional<AudioChunk> assemble(const webm::Bytes& slice) const;

    std::string     recording_id_;
    ExtractorConfig config_;

    webm::Bytes     header_;
    bool            header_invalid_ = false;
    uint64_t        last_offset_ = 0;
    double          last_end_ = 0.0;    // end_time of the last emitted chunk
    int32_t         next_sequence_ = 0;
};

} // namespace cs
