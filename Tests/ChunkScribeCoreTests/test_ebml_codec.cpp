/**
 * test_ebml_codec.cpp - EBML VINTs, element scanning and header rewriting
 */

#include "EbmlCodec.hpp"
#include "TestWebm.hpp"

#include <cassert>
#include <iostream>

using namespace cs;
using namespace cs::test;

void test_var_int_round_trip() {
    struct Case { uint64_t value; size_t length; };
    const Case cases[] = {
        {0, 1}, {1, 1}, {126, 1},
        {127, 2}, {16382, 2},
        {16383, 3}, {(uint64_t{1} << 21) - 2, 3},
        {(uint64_t{1} << 21) - 1, 4},
        {(uint64_t{1} << 56) - 2, 8},
    };

    for (const auto& c : cases) {
        Bytes encoded = webm::encode_var_int(c.value);
        assert(encoded.size() == c.length);

        auto decoded = webm::read_var_int(encoded, 0);
        assert(decoded);
        assert(decoded->value == c.value);
        assert(decoded->length == c.length);
        assert(!decoded->unknown_size);
    }

    std::cout << "[PASS] test_var_int_round_trip" << std::endl;
}

void test_var_int_fixed_length() {
    Bytes wide = webm::encode_var_int(5, 4);
    assert(wide.size() == 4);
    assert(wide[0] == 0x10 && wide[3] == 0x05);
    assert(webm::read_var_int(wide, 0)->value == 5);

    // All-ones is reserved for "unknown size".
    assert(webm::encode_var_int(127, 1).empty());
    assert(webm::encode_var_int(uint64_t{1} << 56).empty());
    assert(webm::encode_var_int(1, 9).empty());

    std::cout << "[PASS] test_var_int_fixed_length" << std::endl;
}

void test_unknown_size_and_malformed() {
    Bytes unknown = {0x01, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    auto v = webm::read_var_int(unknown, 0);
    assert(v && v->unknown_size && v->length == 8);

    Bytes one = {0xFF};
    assert(webm::read_var_int(one, 0)->unknown_size);

    assert(!webm::read_var_int(Bytes{0x00}, 0));
    assert(!webm::read_var_int(Bytes{0x40}, 0));        // truncated 2-byte VINT
    assert(!webm::read_var_int(Bytes{0x81}, 1));        // past the end

    std::cout << "[PASS] test_unknown_size_and_malformed" << std::endl;
}

void test_find_element() {
    Bytes buf(10, 0x00);
    append(buf, make_cluster(0, {0}));

    assert(webm::find_element(buf, webm::kClusterId) == size_t{10});
    assert(webm::find_element(buf, webm::kClusterId, 11) == size_t{10});
    assert(!webm::find_element(buf, webm::kClusterId, 10));
    assert(!webm::find_element(buf, webm::kClusterId, 0));
    assert(!webm::find_element(buf, webm::kClusterId, 4096, 11));
    assert(!webm::find_element(Bytes{0x1F, 0x43}, webm::kClusterId));

    auto header = webm::read_element_header(buf, 10);
    assert(header && header->id == webm::kClusterId);
    assert(header->data_offset() + header->size == buf.size());

    std::cout << "[PASS] test_find_element" << std::endl;
}

void test_minimal_header() {
    Bytes h = webm::synthesize_minimal_header();

    assert(webm::has_ebml_signature(h));
    assert(webm::is_parseable_header(h));
    assert(webm::read_doc_type(h) == std::string("webm"));

    auto ebml = webm::read_element_header(h, 0);
    assert(ebml->data_offset() + ebml->size == h.size() - 12);

    auto segment = webm::read_element_header(h, h.size() - 12);
    assert(segment->id == webm::kSegmentId);
    assert(segment->unknown_size);

    std::cout << "[PASS] test_minimal_header" << std::endl;
}

void test_fix_doc_type() {
    Bytes header = make_header("matroska", 200);
    assert(webm::read_doc_type(header) == std::string("matroska"));

    Bytes fixed = webm::fix_doc_type(header);
    assert(fixed.size() == header.size() - 4);
    assert(webm::read_doc_type(fixed) == std::string("webm"));
    assert(webm::is_parseable_header(fixed));

    auto before = webm::read_element_header(header, 0);
    auto after = webm::read_element_header(fixed, 0);
    assert(after->size == before->size - 4);
    assert(after->size_length == before->size_length);

    // Already webm: untouched.
    assert(webm::fix_doc_type(fixed) == fixed);

    std::cout << "[PASS] test_fix_doc_type" << std::endl;
}

void test_extract_header_prefix() {
    Bytes header = make_header("matroska", 300);
    Bytes recording = header;
    append(recording, make_cluster(0, {0, 20}));

    auto ok = webm::extract_header_prefix(recording);
    assert(ok.status == webm::HeaderStatus::ok);
    assert(ok.header == webm::fix_doc_type(header));

    // Header written, no Cluster yet.
    assert(webm::extract_header_prefix(header).status == webm::HeaderStatus::insufficient_data);
    assert(webm::extract_header_prefix(Bytes{0x1A, 0x45}).status ==
           webm::HeaderStatus::insufficient_data);

    assert(webm::extract_header_prefix(Bytes(64, 0x00)).status ==
           webm::HeaderStatus::invalid_container);

    // A full search window without a Cluster is not a usable recording.
    Bytes huge = make_header("webm", 5000);
    assert(webm::extract_header_prefix(huge, 4096).status ==
           webm::HeaderStatus::invalid_container);

    std::cout << "[PASS] test_extract_header_prefix" << std::endl;
}

void test_rebase_cluster_timecode() {
    Bytes chunk = webm::synthesize_minimal_header();
    size_t first = chunk.size();
    append(chunk, make_cluster(10000, {20, 40}));
    size_t second = chunk.size();
    append(chunk, make_cluster(10060, {0}));

    Bytes out = webm::rebase_cluster_timecode(chunk);
    assert(out.size() == chunk.size());

    assert(cluster_timecode(out, first) == 0);
    assert(first_block_time(out, first) == 0);
    assert(cluster_timecode(out, second) == 40);
    assert(first_block_time(out, second) == 0);

    // Input untouched.
    assert(cluster_timecode(chunk, first) == 10000);

    std::cout << "[PASS] test_rebase_cluster_timecode" << std::endl;
}

void test_rebase_truncated_tail() {
    Bytes chunk = make_cluster(500, {5});
    Bytes tail = make_cluster(560, {0, 10});
    append(chunk, Bytes(tail.begin(), tail.begin() + 12));

    Bytes out = webm::rebase_cluster_timecode(chunk);
    assert(out.size() == chunk.size());
    assert(cluster_timecode(out, 0) == 0);

    assert(webm::rebase_cluster_timecode(Bytes{}).empty());

    std::cout << "[PASS] test_rebase_truncated_tail" << std::endl;
}

int main() {
    std::cout << "=== EbmlCodec Tests ===" << std::endl;

    test_var_int_round_trip();
    test_var_int_fixed_length();
    test_unknown_size_and_malformed();
    test_find_element();
    test_minimal_header();
    test_fix_doc_type();
    test_extract_header_prefix();
    test_rebase_cluster_timecode();
    test_rebase_truncated_tail();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
