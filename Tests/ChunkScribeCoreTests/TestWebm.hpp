#pragma once

// Builders for small synthetic WebM streams used across the tests.

#include "EbmlCodec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cs::test {

using webm::Bytes;

inline void put_id(Bytes& out, uint32_t id) {
    int len = id > 0xFFFFFF ? 4 : id > 0xFFFF ? 3 : id > 0xFF ? 2 : 1;
    for (int i = len - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((id >> (8 * i)) & 0xFF));
    }
}

inline Bytes element(uint32_t id, const Bytes& payload, size_t size_length = 0) {
    Bytes out;
    put_id(out, id);
    Bytes size = webm::encode_var_int(payload.size(), size_length);
    out.insert(out.end(), size.begin(), size.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline Bytes uint_element(uint32_t id, uint64_t value, size_t width) {
    Bytes payload(width);
    for (size_t i = width; i-- > 0;) {
        payload[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return element(id, payload);
}

inline void append(Bytes& out, const Bytes& more) {
    out.insert(out.end(), more.begin(), more.end());
}

/// EBML header with `doc_type`, an unknown-size Segment, then Info and
/// zero-filled Tracks sized so the whole header is `total` bytes.
inline Bytes make_header(const std::string& doc_type = "matroska", size_t total = 400) {
    Bytes ebml;
    append(ebml, uint_element(webm::kEbmlVersionId, 1, 1));
    append(ebml, uint_element(webm::kEbmlReadVersionId, 1, 1));
    append(ebml, uint_element(webm::kEbmlMaxIdLengthId, 4, 1));
    append(ebml, uint_element(webm::kEbmlMaxSizeLengthId, 8, 1));
    append(ebml, element(webm::kDocTypeId, Bytes(doc_type.begin(), doc_type.end())));
    append(ebml, uint_element(webm::kDocTypeVersionId, 4, 1));
    append(ebml, uint_element(webm::kDocTypeReadVersionId, 2, 1));

    Bytes out = element(webm::kEbmlId, ebml);
    put_id(out, webm::kSegmentId);
    out.push_back(0x01);
    out.insert(out.end(), 7, 0xFF);
    append(out, element(webm::kInfoId, Bytes(16, 0x00)));

    // Tracks: 4-byte ID + 2-byte size + padding.
    size_t tracks_payload = total - out.size() - 6;
    append(out, element(webm::kTracksId, Bytes(tracks_payload, 0x00), 2));
    return out;
}

/// Cluster with a 2-byte Timecode and one SimpleBlock (track 1) per
/// relative block time.
inline Bytes make_cluster(uint64_t timecode, const std::vector<int16_t>& block_times,
                          size_t frame_bytes = 24) {
    Bytes payload = uint_element(webm::kTimecodeId, timecode, 2);
    for (int16_t t : block_times) {
        Bytes block;
        block.push_back(0x81);
        block.push_back(static_cast<uint8_t>((static_cast<uint16_t>(t) >> 8) & 0xFF));
        block.push_back(static_cast<uint8_t>(static_cast<uint16_t>(t) & 0xFF));
        block.push_back(0x80);
        block.insert(block.end(), frame_bytes, 0x11);
        append(payload, element(webm::kSimpleBlockId, block));
    }
    return element(webm::kClusterId, payload);
}

/// Timecode value of the Cluster at `offset`.
inline uint64_t cluster_timecode(const Bytes& buf, size_t offset) {
    auto cluster = webm::read_element_header(buf, offset);
    auto tc = webm::read_element_header(buf, cluster->data_offset());
    uint64_t v = 0;
    for (size_t i = 0; i < tc->size; ++i) v = (v << 8) | buf[tc->data_offset() + i];
    return v;
}

/// Relative timecode of the first SimpleBlock in the Cluster at `offset`.
inline int16_t first_block_time(const Bytes& buf, size_t offset) {
    auto cluster = webm::read_element_header(buf, offset);
    auto tc = webm::read_element_header(buf, cluster->data_offset());
    auto block = webm::read_element_header(buf, tc->data_offset() + tc->size);
    size_t at = block->data_offset() + 1;
    return static_cast<int16_t>((buf[at] << 8) | buf[at + 1]);
}

} // namespace cs::test
