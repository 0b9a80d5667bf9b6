/**
 * test_realtime_text_manager.cpp - Bucketed dedup, replacement, file output
 */

#include "RealtimeTextManager.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

using namespace cs;
namespace fs = std::filesystem;

namespace {

TranscriptionSegment seg(double start, double end, const std::string& text) {
    TranscriptionSegment s;
    s.start = start;
    s.end = end;
    s.text = text;
    s.confidence = 0.9;
    return s;
}

ChunkResult result(int32_t seq, std::vector<TranscriptionSegment> segments) {
    ChunkResult r;
    r.chunk_id = "rec_chunk_00" + std::to_string(seq);
    r.sequence_number = seq;
    r.status = ChunkStatus::completed;
    r.segments = std::move(segments);
    r.confidence = 0.9;
    return r;
}

RealtimeTextConfig manual_config() {
    RealtimeTextConfig config;
    config.enable_auto_save = false;
    return config;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

fs::path temp_file(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() / (name + "_" + std::to_string(stamp) + ".rt.txt");
}

struct UpdateCounter : TextUpdateObserver {
    int updates = 0;
    std::string last_text;

    void on_text_update(const std::string& full_text, const RealtimeMetadata&) override {
        ++updates;
        last_text = full_text;
    }
};

} // namespace

void test_later_chunk_wins_bucket() {
    RealtimeTextManager rt(manual_config());

    rt.on_chunk_result(result(1, {seg(0.2, 1.5, "first take"), seg(1.2, 2.8, "second part")}));
    assert(rt.generate_full_text() == "first take second part");

    rt.on_chunk_result(result(2, {seg(0.1, 1.4, "better take")}));
    assert(rt.generate_full_text() == "better take second part");

    std::cout << "[PASS] test_later_chunk_wins_bucket" << std::endl;
}

void test_higher_sequence_wins_regardless_of_order() {
    RealtimeTextManager rt(manual_config());

    rt.on_chunk_result(result(7, {seg(3.0, 4.5, "from seven")}));
    rt.on_chunk_result(result(3, {seg(3.4, 4.9, "from three")}));
    assert(rt.generate_full_text() == "from seven");
    assert(rt.get_segments().size() == 2);

    std::cout << "[PASS] test_higher_sequence_wins_regardless_of_order" << std::endl;
}

void test_same_chunk_replaces_segments() {
    RealtimeTextManager rt(manual_config());

    rt.on_chunk_result(result(1, {seg(0.0, 1.0, "old")}));
    rt.on_chunk_result(result(1, {seg(0.0, 1.0, "new"), seg(2.0, 3.0, "words")}));

    auto segs = rt.get_segments();
    assert(segs.size() == 2);
    assert(segs[0].text == "new");
    assert(segs[1].segment_index == 1);
    assert(rt.generate_full_text() == "new words");
    assert(rt.get_metadata().processed_chunks == 1);

    std::cout << "[PASS] test_same_chunk_replaces_segments" << std::endl;
}

void test_time_range_files() {
    RealtimeTextConfig config = manual_config();
    config.chunk_interval_seconds = 5.0;
    RealtimeTextManager rt(config);

    rt.add_result(result(1, {seg(1.0, 2.0, "chunk one")}), "timerange_chunk_001.webm");
    // Only segments inside [5, 10) are taken from chunk 2.
    rt.add_result(result(2, {seg(4.0, 4.9, "outside"), seg(5.5, 6.0, "inside")}),
                  "timerange_chunk_002.webm");
    assert(rt.generate_full_text() == "chunk one inside");

    // A new version of chunk 2 replaces whatever covered its range.
    rt.add_result(result(2, {seg(7.0, 8.0, "replaced")}), "timerange_chunk_002.webm");
    assert(rt.generate_full_text() == "chunk one replaced");

    // Nothing inside the range: buffer left alone.
    rt.add_result(result(2, {seg(12.0, 13.0, "elsewhere")}), "timerange_chunk_002.webm");
    assert(rt.generate_full_text() == "chunk one replaced");

    std::cout << "[PASS] test_time_range_files" << std::endl;
}

void test_buffer_eviction() {
    RealtimeTextConfig config = manual_config();
    config.buffer_size = 3;
    RealtimeTextManager rt(config);

    rt.on_chunk_result(result(1, {seg(0.0, 1.0, "a1"), seg(1.0, 2.0, "a2")}));
    rt.on_chunk_result(result(2, {seg(5.0, 6.0, "b1"), seg(6.0, 7.0, "b2")}));

    auto segs = rt.get_segments();
    assert(segs.size() == 3);
    assert(segs[0].text == "a2");
    assert(segs[2].text == "b2");

    std::cout << "[PASS] test_buffer_eviction" << std::endl;
}

void test_join_after_ideographic_full_stop() {
    RealtimeTextManager rt(manual_config());
    const std::string first = "\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82";  // 你好。
    const std::string second = "\xE4\xB8\x96\xE7\x95\x8C";              // 世界

    rt.on_chunk_result(result(1, {seg(0.0, 1.0, first), seg(2.0, 3.0, second)}));
    assert(rt.generate_full_text() == first + second);

    std::cout << "[PASS] test_join_after_ideographic_full_stop" << std::endl;
}

void test_file_output() {
    fs::path path = temp_file("cs_rt_detailed");
    RealtimeTextManager rt(manual_config());
    UpdateCounter counter;
    rt.add_observer(&counter);

    rt.start(path.string());
    assert(rt.get_metadata().status == RealtimeStatus::transcribing);

    rt.on_chunk_result(result(1, {seg(0.0, 1.0, "hello"), seg(1.0, 2.5, "there")}));
    assert(counter.updates == 1);
    assert(counter.last_text == "hello there");
    assert(rt.is_modified());

    assert(rt.flush());
    assert(!rt.is_modified());
    std::string content = read_file(path);
    assert(content.find("# Realtime Transcript") != std::string::npos);
    assert(content.find("status: transcribing") != std::string::npos);
    assert(content.find("## Transcript\nhello there\n") != std::string::npos);
    assert(content.find("Transcribing...") != std::string::npos);
    assert(content.find("### Chunk 1: rec_chunk_001") != std::string::npos);
    assert(content.find("[1s-2s] there") != std::string::npos);

    rt.set_total_chunks(1);
    rt.stop();
    assert(rt.get_metadata().status == RealtimeStatus::completed);
    content = read_file(path);
    assert(content.find("Transcription complete") != std::string::npos);

    fs::remove(path);
    std::cout << "[PASS] test_file_output" << std::endl;
}

void test_simple_format() {
    fs::path path = temp_file("cs_rt_simple");
    RealtimeTextConfig config = manual_config();
    config.file_format = RealtimeFileFormat::simple;
    RealtimeTextManager rt(config);

    rt.start(path.string());
    rt.on_chunk_result(result(0, {seg(0.0, 1.0, "just text")}));
    rt.stop();
    assert(read_file(path) == "just text");

    fs::remove(path);
    std::cout << "[PASS] test_simple_format" << std::endl;
}

void test_autosave() {
    fs::path path = temp_file("cs_rt_autosave");
    RealtimeTextConfig config;
    config.write_interval_ms = 20;
    RealtimeTextManager rt(config);

    rt.start(path.string());
    rt.on_chunk_result(result(0, {seg(0.0, 1.0, "saved")}));
    for (int i = 0; i < 100 && !fs::exists(path); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(fs::exists(path));
    rt.stop();

    fs::remove(path);
    std::cout << "[PASS] test_autosave" << std::endl;
}

void test_failures_and_terminal_error() {
    RealtimeTextManager rt(manual_config());
    rt.start("");

    ChunkResult failed;
    failed.chunk_id = "rec_chunk_002";
    failed.sequence_number = 2;
    failed.status = ChunkStatus::failed;
    rt.on_chunk_result(failed);
    assert(rt.get_metadata().error_count == 1);
    assert(rt.get_metadata().status == RealtimeStatus::transcribing);

    failed.terminal = true;
    rt.on_chunk_result(failed);
    assert(rt.get_metadata().error_count == 2);
    assert(rt.get_metadata().status == RealtimeStatus::error);

    rt.stop();
    assert(rt.get_metadata().status == RealtimeStatus::error);
    assert(rt.generate_file_content().find("Transcription stopped after errors") !=
           std::string::npos);

    std::cout << "[PASS] test_failures_and_terminal_error" << std::endl;
}

void test_progress_estimate() {
    RealtimeTextManager rt(manual_config());
    rt.start("");
    rt.set_total_chunks(4);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    rt.on_chunk_result(result(0, {seg(0.0, 1.0, "one")}));
    rt.on_chunk_result(result(0, {seg(0.0, 1.0, "one again")}));

    RealtimeMetadata md = rt.get_metadata();
    assert(md.processed_chunks == 1);
    assert(md.estimated_duration_ms > 0);

    rt.set_total_chunks(1);
    assert(rt.get_metadata().estimated_duration_ms == 0);

    std::cout << "[PASS] test_progress_estimate" << std::endl;
}

void test_output_path_for() {
    assert(RealtimeTextManager::output_path_for("out/transcript.txt") ==
           (fs::path("out") / "transcript.rt.txt").string());
    assert(RealtimeTextManager::output_path_for("recording.webm") == "recording.rt.txt");

    std::cout << "[PASS] test_output_path_for" << std::endl;
}

int main() {
    std::cout << "=== RealtimeTextManager Tests ===" << std::endl;

    test_later_chunk_wins_bucket();
    test_higher_sequence_wins_regardless_of_order();
    test_same_chunk_replaces_segments();
    test_time_range_files();
    test_buffer_eviction();
    test_join_after_ideographic_full_stop();
    test_file_output();
    test_simple_format();
    test_autosave();
    test_failures_and_terminal_error();
    test_progress_estimate();
    test_output_path_for();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
