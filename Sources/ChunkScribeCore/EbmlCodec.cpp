#include "EbmlCodec.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace cs::webm {

namespace {

constexpr uint8_t kSignature[4] = {0x1A, 0x45, 0xDF, 0xA3};

size_t id_byte_length(uint32_t id) {
    if (id <= 0xFF)     return 1;
    if (id <= 0xFFFF)   return 2;
    if (id <= 0xFFFFFF) return 3;
    return 4;
}

void append_id(Bytes& out, uint32_t id) {
    size_t len = id_byte_length(id);
    for (size_t i = len; i-- > 0;) {
        out.push_back(static_cast<uint8_t>((id >> (8 * i)) & 0xFF));
    }
}

void append_element(Bytes& out, uint32_t id, const Bytes& payload) {
    append_id(out, id);
    Bytes size = encode_var_int(payload.size());
    out.insert(out.end(), size.begin(), size.end());
    out.insert(out.end(), payload.begin(), payload.end());
}

void append_uint_element(Bytes& out, uint32_t id, uint8_t value) {
    append_element(out, id, Bytes{value});
}

uint64_t read_uint(const Bytes& buffer, size_t offset, size_t length) {
    uint64_t v = 0;
    for (size_t i = 0; i < length; ++i) {
        v = (v << 8) | buffer[offset + i];
    }
    return v;
}

void write_uint(Bytes& buffer, size_t offset, size_t length, uint64_t value) {
    for (size_t i = length; i-- > 0;) {
        buffer[offset + i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

/// Find a direct child of the element described by `parent`.
std::optional<ElementHeader> find_child(const Bytes& buffer,
                                        const ElementHeader& parent,
                                        uint32_t child_id) {
    if (parent.unknown_size) return std::nullopt;
    size_t end = parent.data_offset() + static_cast<size_t>(parent.size);
    if (end > buffer.size()) return std::nullopt;

    size_t pos = parent.data_offset();
    while (pos < end) {
        auto child = read_element_header(buffer, pos);
        if (!child || child->unknown_size) return std::nullopt;
        size_t child_end = child->data_offset() + static_cast<size_t>(child->size);
        if (child_end > end) return std::nullopt;
        if (child->id == child_id) return child;
        pos = child_end;
    }
    return std::nullopt;
}

int16_t clamp_int16(int64_t v) {
    if (v < std::numeric_limits<int16_t>::min()) return std::numeric_limits<int16_t>::min();
    if (v > std::numeric_limits<int16_t>::max()) return std::numeric_limits<int16_t>::max();
    return static_cast<int16_t>(v);
}

/// Relative timecode field of a (Simple)Block: after the track-number VINT.
std::optional<size_t> block_timecode_offset(const Bytes& buffer,
                                            size_t data_offset,
                                            size_t data_end) {
    auto track = read_var_int(buffer, data_offset);
    if (!track) return std::nullopt;
    size_t tc = data_offset + track->length;
    if (tc + 2 > data_end) return std::nullopt;
    return tc;
}

struct RebaseState {
    bool     first_cluster = true;
    uint64_t cluster_base = 0;
    bool     have_block_shift = false;
    int64_t  block_shift = 0;
};

void rebase_block(Bytes& out, size_t data_offset, size_t data_end, RebaseState& st) {
    // Only blocks in the first cluster move; later clusters absorb the shift
    // through their own timecode.
    if (!st.first_cluster) return;
    auto tc = block_timecode_offset(out, data_offset, data_end);
    if (!tc) return;

    int16_t rel = static_cast<int16_t>(read_uint(out, *tc, 2));
    if (!st.have_block_shift) {
        st.block_shift = rel;
        st.have_block_shift = true;
    }
    int16_t rebased = clamp_int16(static_cast<int64_t>(rel) - st.block_shift);
    write_uint(out, *tc, 2, static_cast<uint16_t>(rebased));
}

void rebase_timecode(Bytes& out, const ElementHeader& el, RebaseState& st) {
    size_t len = static_cast<size_t>(el.size);
    if (len == 0 || len > 8) return;
    uint64_t value = read_uint(out, el.data_offset(), len);

    uint64_t rebased = 0;
    if (st.first_cluster) {
        st.cluster_base = value;
    } else {
        int64_t v = static_cast<int64_t>(value) -
                    static_cast<int64_t>(st.cluster_base) - st.block_shift;
        rebased = v > 0 ? static_cast<uint64_t>(v) : 0;
        rebased = std::min(rebased, value);
    }
    write_uint(out, el.data_offset(), len, rebased);
}

} // namespace

// ---------------------------------------------------------------------------
// VINT
// ---------------------------------------------------------------------------

std::optional<VarInt> read_var_int(const Bytes& buffer, size_t offset) {
    if (offset >= buffer.size()) return std::nullopt;

    uint8_t first = buffer[offset];
    if (first == 0) return std::nullopt;

    size_t length = 1;
    uint8_t mask = 0x80;
    while (!(first & mask)) {
        mask >>= 1;
        ++length;
    }
    if (offset + length > buffer.size()) return std::nullopt;

    VarInt v;
    v.length = length;
    v.value = first & static_cast<uint8_t>(mask - 1);
    for (size_t i = 1; i < length; ++i) {
        v.value = (v.value << 8) | buffer[offset + i];
    }
    uint64_t all_ones = (uint64_t{1} << (7 * length)) - 1;
    v.unknown_size = (v.value == all_ones);
    return v;
}

Bytes encode_var_int(uint64_t value, size_t length) {
    if (length > 8) return {};

    if (length == 0) {
        for (size_t len = 1; len <= 8; ++len) {
            uint64_t max = (uint64_t{1} << (7 * len)) - 2;
            if (value <= max) {
                length = len;
                break;
            }
        }
        if (length == 0) return {};
    } else {
        uint64_t max = (uint64_t{1} << (7 * length)) - 2;
        if (value > max) return {};
    }

    uint64_t marked = value | (uint64_t{1} << (7 * length));
    Bytes out(length);
    write_uint(out, 0, length, marked);
    return out;
}

// ---------------------------------------------------------------------------
// Elements
// ---------------------------------------------------------------------------

std::optional<ElementHeader> read_element_header(const Bytes& buffer, size_t offset) {
    if (offset >= buffer.size()) return std::nullopt;

    uint8_t first = buffer[offset];
    size_t id_len = 0;
    if      (first & 0x80) id_len = 1;
    else if (first & 0x40) id_len = 2;
    else if (first & 0x20) id_len = 3;
    else if (first & 0x10) id_len = 4;
    else return std::nullopt;

    if (offset + id_len > buffer.size()) return std::nullopt;

    auto size = read_var_int(buffer, offset + id_len);
    if (!size) return std::nullopt;

    ElementHeader h;
    h.id = static_cast<uint32_t>(read_uint(buffer, offset, id_len));
    h.offset = offset;
    h.id_length = id_len;
    h.size = size->value;
    h.size_length = size->length;
    h.unknown_size = size->unknown_size;
    return h;
}

std::optional<size_t> find_element(const Bytes& buffer,
                                   uint32_t element_id,
                                   size_t search_window,
                                   size_t start) {
    size_t id_len = id_byte_length(element_id);
    if (search_window == 0 || buffer.size() < id_len ||
        start > buffer.size() - id_len) {
        return std::nullopt;
    }

    uint8_t pattern[4];
    for (size_t i = 0; i < id_len; ++i) {
        pattern[i] = static_cast<uint8_t>((element_id >> (8 * (id_len - 1 - i))) & 0xFF);
    }

    size_t last = buffer.size() - id_len;
    if (search_window <= last - start) {
        last = start + search_window - 1;
    }
    for (size_t pos = start; pos <= last; ++pos) {
        if (std::memcmp(buffer.data() + pos, pattern, id_len) == 0) {
            return pos;
        }
    }
    return std::nullopt;
}

bool has_ebml_signature(const Bytes& buffer) {
    return buffer.size() >= 4 &&
           std::memcmp(buffer.data(), kSignature, sizeof(kSignature)) == 0;
}

std::optional<std::string> read_doc_type(const Bytes& buffer) {
    auto ebml = read_element_header(buffer, 0);
    if (!ebml || ebml->id != kEbmlId) return std::nullopt;

    auto doc = find_child(buffer, *ebml, kDocTypeId);
    if (!doc) return std::nullopt;

    const char* begin = reinterpret_cast<const char*>(buffer.data() + doc->data_offset());
    std::string s(begin, static_cast<size_t>(doc->size));
    // DocType strings may be NUL padded.
    s.erase(std::find(s.begin(), s.end(), '\0'), s.end());
    return s;
}

bool is_parseable_header(const Bytes& buffer) {
    if (!has_ebml_signature(buffer)) return false;

    auto ebml = read_element_header(buffer, 0);
    if (!ebml || ebml->unknown_size) return false;
    size_t end = ebml->data_offset() + static_cast<size_t>(ebml->size);
    if (end > buffer.size()) return false;

    auto doc = read_doc_type(buffer);
    if (!doc || doc->empty()) return false;

    auto segment = read_element_header(buffer, end);
    return segment && segment->id == kSegmentId;
}

// ---------------------------------------------------------------------------
// Header handling
// ---------------------------------------------------------------------------

HeaderResult extract_header_prefix(const Bytes& first_bytes, size_t search_window) {
    HeaderResult result;

    if (first_bytes.size() < sizeof(kSignature)) {
        bool prefix_matches = std::equal(first_bytes.begin(), first_bytes.end(), kSignature);
        result.status = prefix_matches ? HeaderStatus::insufficient_data
                                       : HeaderStatus::invalid_container;
        return result;
    }
    if (!has_ebml_signature(first_bytes)) {
        result.status = HeaderStatus::invalid_container;
        return result;
    }

    auto cluster = find_element(first_bytes, kClusterId, search_window);
    if (!cluster) {
        result.status = first_bytes.size() < search_window
                            ? HeaderStatus::insufficient_data
                            : HeaderStatus::invalid_container;
        return result;
    }

    Bytes header(first_bytes.begin(), first_bytes.begin() + static_cast<std::ptrdiff_t>(*cluster));
    result.header = fix_doc_type(header);
    result.status = HeaderStatus::ok;
    return result;
}

Bytes fix_doc_type(const Bytes& header) {
    auto ebml = read_element_header(header, 0);
    if (!ebml || ebml->id != kEbmlId) return header;

    auto doc = find_child(header, *ebml, kDocTypeId);
    if (!doc) return header;

    static const std::string kMatroska = "matroska";
    static const std::string kWebm = "webm";
    std::string current(reinterpret_cast<const char*>(header.data() + doc->data_offset()),
                        static_cast<size_t>(doc->size));
    if (current != kMatroska) return header;

    size_t shrink = kMatroska.size() - kWebm.size();
    Bytes doc_size = encode_var_int(kWebm.size(), doc->size_length);
    Bytes ebml_size = encode_var_int(ebml->size - shrink, ebml->size_length);
    if (doc_size.empty() || ebml_size.empty()) return header;

    size_t doc_end = doc->data_offset() + static_cast<size_t>(doc->size);

    Bytes out;
    out.reserve(header.size() - shrink);
    out.insert(out.end(), header.begin(), header.begin() + static_cast<std::ptrdiff_t>(ebml->id_length));
    out.insert(out.end(), ebml_size.begin(), ebml_size.end());
    out.insert(out.end(),
               header.begin() + static_cast<std::ptrdiff_t>(ebml->data_offset()),
               header.begin() + static_cast<std::ptrdiff_t>(doc->offset + doc->id_length));
    out.insert(out.end(), doc_size.begin(), doc_size.end());
    out.insert(out.end(), kWebm.begin(), kWebm.end());
    out.insert(out.end(),
               header.begin() + static_cast<std::ptrdiff_t>(doc_end),
               header.end());
    return out;
}

Bytes synthesize_minimal_header() {
    Bytes payload;
    append_uint_element(payload, kEbmlVersionId, 1);
    append_uint_element(payload, kEbmlReadVersionId, 1);
    append_uint_element(payload, kEbmlMaxIdLengthId, 4);
    append_uint_element(payload, kEbmlMaxSizeLengthId, 8);
    append_element(payload, kDocTypeId, Bytes{'w', 'e', 'b', 'm'});
    append_uint_element(payload, kDocTypeVersionId, 2);
    append_uint_element(payload, kDocTypeReadVersionId, 2);

    Bytes out;
    append_element(out, kEbmlId, payload);

    // Segment of unknown size: 8-byte VINT with every value bit set.
    append_id(out, kSegmentId);
    out.push_back(0x01);
    out.insert(out.end(), 7, 0xFF);
    return out;
}

// ---------------------------------------------------------------------------
// rebase_cluster_timecode
// ---------------------------------------------------------------------------

Bytes rebase_cluster_timecode(const Bytes& chunk) {
    Bytes out = chunk;

    auto first = find_element(out, kClusterId, out.size());
    if (!first) return out;

    RebaseState st;
    size_t pos = *first;
    while (pos < out.size()) {
        auto cluster = read_element_header(out, pos);
        if (!cluster || cluster->id != kClusterId) break;

        size_t end = out.size();
        if (!cluster->unknown_size) {
            end = std::min(out.size(),
                           cluster->data_offset() + static_cast<size_t>(cluster->size));
        }

        size_t next = end;
        size_t child = cluster->data_offset();
        while (child < end) {
            auto el = read_element_header(out, child);
            if (!el) break;
            if (el->id == kClusterId) {
                next = child;
                break;
            }
            if (el->unknown_size) break;
            size_t el_end = el->data_offset() + static_cast<size_t>(el->size);
            if (el_end > out.size()) break;     // truncated tail

            if (el->id == kTimecodeId) {
                rebase_timecode(out, *el, st);
            } else if (el->id == kSimpleBlockId) {
                rebase_block(out, el->data_offset(), el_end, st);
            } else if (el->id == kBlockGroupId) {
                size_t inner = el->data_offset();
                while (inner < el_end) {
                    auto b = read_element_header(out, inner);
                    if (!b || b->unknown_size) break;
                    size_t b_end = b->data_offset() + static_cast<size_t>(b->size);
                    if (b_end > el_end) break;
                    if (b->id == kBlockId) {
                        rebase_block(out, b->data_offset(), b_end, st);
                    }
                    inner = b_end;
                }
            }
            child = el_end;
        }

        if (next <= pos) break;
        pos = next;
        st.first_cluster = false;
    }
    return out;
}

} // namespace cs::webm
