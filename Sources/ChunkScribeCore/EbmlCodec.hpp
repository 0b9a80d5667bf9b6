#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cs::webm {

using Bytes = std::vector<uint8_t>;

// ---------------------------------------------------------------------------
// Element IDs (stored with their length-marker bits, as they appear on disk)
// ---------------------------------------------------------------------------

constexpr uint32_t kEbmlId               = 0x1A45DFA3;
constexpr uint32_t kEbmlVersionId        = 0x4286;
constexpr uint32_t kEbmlReadVersionId    = 0x42F7;
constexpr uint32_t kEbmlMaxIdLengthId    = 0x42F2;
constexpr uint32_t kEbmlMaxSizeLengthId  = 0x42F3;
constexpr uint32_t kDocTypeId            = 0x4282;
constexpr uint32_t kDocTypeVersionId     = 0x4287;
constexpr uint32_t kDocTypeReadVersionId = 0x4285;
constexpr uint32_t kSegmentId            = 0x18538067;
constexpr uint32_t kInfoId               = 0x1549A966;
constexpr uint32_t kTracksId             = 0x1654AE6B;
constexpr uint32_t kClusterId            = 0x1F43B675;
constexpr uint32_t kTimecodeId           = 0xE7;
constexpr uint32_t kSimpleBlockId        = 0xA3;
constexpr uint32_t kBlockGroupId         = 0xA0;
constexpr uint32_t kBlockId              = 0xA1;

/// Default number of bytes scanned when looking for an element.
constexpr size_t kDefaultSearchWindow = 4096;

// ---------------------------------------------------------------------------
// VINT
// ---------------------------------------------------------------------------

struct VarInt {
    uint64_t value = 0;
    size_t   length = 0;
    bool     unknown_size = false;  // all value bits set
};

/// Decode the variable-length integer at `offset`. Returns nullopt when the
/// first byte carries no marker bit or the buffer ends early.
std::optional<VarInt> read_var_int(const Bytes& buffer, size_t offset);

/// Encode `value` as a VINT. With `length == 0` the shortest encoding is used.
/// Returns an empty buffer when the value does not fit in `length` bytes
/// (or in 8 bytes at all).
Bytes encode_var_int(uint64_t value, size_t length = 0);

// ---------------------------------------------------------------------------
// Elements
// ---------------------------------------------------------------------------

struct ElementHeader {
    uint32_t id = 0;
    size_t   offset = 0;        // where the ID starts
    size_t   id_length = 0;
    uint64_t size = 0;
    size_t   size_length = 0;
    bool     unknown_size = false;

    size_t data_offset() const { return offset + id_length + size_length; }
};

/// Read the ID and size fields of the element starting at `offset`.
std::optional<ElementHeader> read_element_header(const Bytes& buffer, size_t offset);

/// Linear scan for `element_id` (1-4 bytes) in
/// [start, start + search_window). Returns the offset of its first byte.
std::optional<size_t> find_element(const Bytes& buffer,
                                   uint32_t element_id,
                                   size_t search_window = kDefaultSearchWindow,
                                   size_t start = 0);

/// True if the buffer begins with 1A 45 DF A3.
bool has_ebml_signature(const Bytes& buffer);

/// DocType string stored in the leading EBML header, if one can be read.
std::optional<std::string> read_doc_type(const Bytes& buffer);

/// True if the buffer starts with a complete EBML header carrying a DocType,
/// immediately followed by a Segment element.
bool is_parseable_header(const Bytes& buffer);

// ---------------------------------------------------------------------------
// Header handling
// ---------------------------------------------------------------------------

enum class HeaderStatus {
    ok,
    insufficient_data,  // signature present, no Cluster written yet
    invalid_container   // no EBML signature, or no Cluster within the window
};

struct HeaderResult {
    HeaderStatus status = HeaderStatus::invalid_container;
    Bytes        header;
};

/// Everything before the first Cluster of a recording, with the DocType
/// normalised to "webm".
HeaderResult extract_header_prefix(const Bytes& first_bytes,
                                   size_t search_window = kDefaultSearchWindow);

/// Rewrite a "matroska" DocType to "webm", shrinking the EBML header size
/// field by the same amount. Anything else is returned unchanged.
Bytes fix_doc_type(const Bytes& header);

/// EBML header (version 1, DocType webm v2) followed by an unknown-size Segment.
Bytes synthesize_minimal_header();

/// Zero the first Cluster's timecode and shift block timecodes so the first
/// block plays at 0. Later clusters keep their spacing relative to the first.
Bytes rebase_cluster_timecode(const Bytes& chunk);

} // namespace cs::webm
