/**
 * test_transcription_queue.cpp - Retries, circuit breaker, priorities
 */

#include "TranscriptionQueue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

using namespace cs;
namespace fs = std::filesystem;

namespace {

/// Answers each call from a script keyed by chunk id. The chunk id is
/// recovered from the temp file name (<id>_<n>.webm).
class ScriptedService : public TranscriptionService {
public:
    using Script = std::function<TranscriptionResponse(const std::string& id, int attempt)>;

    explicit ScriptedService(Script script) : script_(std::move(script)) {}

    TranscriptionResponse transcribe(const std::string& audio_path) override {
        assert(fs::exists(audio_path));
        std::string stem = fs::path(audio_path).stem().string();
        std::string id = stem.substr(0, stem.rfind('_'));

        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mu_);
            attempt = ++attempts_[id];
            ++calls_;
            order_.push_back(id);
        }
        return script_(id, attempt);
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_;
    }

    std::vector<std::string> order() const {
        std::lock_guard<std::mutex> lock(mu_);
        return order_;
    }

private:
    Script                      script_;
    std::map<std::string, int>  attempts_;
    std::vector<std::string>    order_;
    int                         calls_ = 0;
    mutable std::mutex          mu_;
};

struct Collector : ResultObserver {
    std::vector<ChunkResult> results;
    std::mutex mu;

    void on_chunk_result(const ChunkResult& result) override {
        std::lock_guard<std::mutex> lock(mu);
        results.push_back(result);
    }
};

AudioChunk make_chunk(const std::string& id, int32_t seq, double start, double end) {
    AudioChunk c;
    c.id = id;
    c.sequence_number = seq;
    c.start_time = start;
    c.end_time = end;
    c.audio_data.assign(64, 0x42);
    return c;
}

TranscriptionResponse one_segment(const std::string& text) {
    TranscriptionResponse r;
    TranscriptionSegment s;
    s.start = 0.5;
    s.end = 1.5;
    s.text = text;
    r.segments.push_back(s);
    return r;
}

QueueConfig fast_config() {
    QueueConfig config;
    config.retry_base_delay_ms = 10;
    config.retry_max_delay_ms = 20;
    config.temp_dir = (fs::temp_directory_path() / "cs_queue_test").string();
    return config;
}

} // namespace

void test_retry_then_success() {
    ScriptedService service([](const std::string& id, int attempt) {
        if (id == "c2" && attempt <= 2) {
            throw TranscriptionError(ErrorKind::network_error, "connection reset by peer");
        }
        return one_segment("text of " + id);
    });

    QueueConfig config = fast_config();
    config.max_retries = 2;

    TranscriptionQueue queue(service, config);
    Collector collector;
    queue.add_observer(&collector);
    queue.start();

    for (int i = 0; i < 5; ++i) {
        double start = i * 5.0;
        queue.enqueue(make_chunk("c" + std::to_string(i), i, start, start + 5.0));
    }

    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    auto item = queue.get_item("c2");
    assert(item);
    assert(item->retry_count == 2);
    assert(item->state == QueueItemState::completed);
    assert(item->last_error_kind == ErrorKind::network_error);

    assert(collector.results.size() == 5);
    for (const auto& r : collector.results) {
        assert(r.status == ChunkStatus::completed);
    }
    assert(service.calls() == 7);

    // Segment times are made absolute.
    for (const auto& r : queue.get_completed_results()) {
        if (r.chunk_id != "c2") continue;
        assert(r.segments.size() == 1);
        assert(r.segments[0].start == 10.5);
        assert(r.segments[0].end == 11.5);
    }

    QueueStats stats = queue.get_stats();
    assert(stats.total == 5);
    assert(stats.completed == 5);
    assert(stats.failed == 0);
    assert(!stats.halted);

    std::cout << "[PASS] test_retry_then_success" << std::endl;
}

void test_circuit_breaker() {
    ScriptedService service([](const std::string&, int) -> TranscriptionResponse {
        throw TranscriptionError(ErrorKind::service_unavailable, "connection refused");
    });

    QueueConfig config = fast_config();
    config.max_concurrency = 1;
    config.max_retries = 0;

    TranscriptionQueue queue(service, config);
    Collector collector;
    queue.add_observer(&collector);

    for (int i = 0; i < 6; ++i) {
        double start = i * 5.0;
        queue.enqueue(make_chunk("c" + std::to_string(i), i, start, start + 5.0), 6);
    }
    queue.start();

    assert(queue.wait_idle(std::chrono::seconds(5)));
    assert(queue.is_halted());
    queue.stop();

    assert(service.calls() == 5);

    int terminal = 0;
    for (const auto& r : collector.results) {
        assert(r.status == ChunkStatus::failed);
        if (r.terminal) ++terminal;
    }
    assert(terminal == 1);
    assert(collector.results.back().terminal);
    assert(collector.results.back().error_kind == ErrorKind::service_unavailable);

    QueueStats stats = queue.get_stats();
    assert(stats.halted);
    assert(stats.pending == 1);
    assert(stats.failed == 5);

    std::cout << "[PASS] test_circuit_breaker" << std::endl;
}

void test_breaker_needs_failures_inside_window() {
    // Each call takes 60 ms, so no 100 ms window ever holds 5 failures.
    ScriptedService service([](const std::string&, int) -> TranscriptionResponse {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        throw TranscriptionError(ErrorKind::service_unavailable, "connection refused");
    });

    QueueConfig config = fast_config();
    config.max_concurrency = 1;
    config.max_retries = 0;
    config.breaker_window_ms = 100;

    TranscriptionQueue queue(service, config);
    for (int i = 0; i < 5; ++i) {
        queue.enqueue(make_chunk("w" + std::to_string(i), i, i * 5.0, i * 5.0 + 5.0), 5);
    }
    queue.start();
    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    assert(!queue.is_halted());
    assert(service.calls() == 5);
    auto results = queue.get_results();
    assert(results.size() == 5);
    for (const auto& r : results) {
        assert(r.status == ChunkStatus::failed);
        assert(!r.terminal);
    }

    std::cout << "[PASS] test_breaker_needs_failures_inside_window" << std::endl;
}

void test_success_resets_breaker() {
    ScriptedService service([](const std::string& id, int) -> TranscriptionResponse {
        if (id == "r1") return one_segment(id);
        throw TranscriptionError(ErrorKind::service_unavailable, "connection refused");
    });

    QueueConfig config = fast_config();
    config.max_concurrency = 1;
    config.max_retries = 0;
    config.breaker_threshold = 3;

    TranscriptionQueue queue(service, config);
    for (int i = 0; i < 4; ++i) {
        queue.enqueue(make_chunk("r" + std::to_string(i), i, i * 5.0, i * 5.0 + 5.0), 4);
    }
    queue.start();
    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    // r0 fails, r1 succeeds, r2 and r3 fail: the streak never reaches 3.
    assert(!queue.is_halted());
    assert(service.calls() == 4);
    QueueStats stats = queue.get_stats();
    assert(stats.completed == 1);
    assert(stats.failed == 3);

    std::cout << "[PASS] test_success_resets_breaker" << std::endl;
}

void test_temp_files_removed() {
    fs::path temp = fs::temp_directory_path() / "cs_queue_temp";
    fs::remove_all(temp);

    ScriptedService service([](const std::string& id, int) -> TranscriptionResponse {
        if (id == "bad") throw std::runtime_error("decoder exploded");
        return one_segment(id);
    });

    QueueConfig config = fast_config();
    config.max_retries = 0;
    config.temp_dir = temp.string();

    TranscriptionQueue queue(service, config);
    queue.start();

    queue.enqueue(make_chunk("good", 0, 0.0, 5.0));
    assert(queue.wait_idle(std::chrono::seconds(5)));
    assert(fs::is_directory(temp));
    assert(fs::is_empty(temp));

    queue.enqueue(make_chunk("bad", 1, 5.0, 10.0));
    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    assert(service.calls() == 2);
    assert(queue.get_item("bad")->state == QueueItemState::failed);
    assert(fs::is_empty(temp));

    fs::remove_all(temp);
    std::cout << "[PASS] test_temp_files_removed" << std::endl;
}

void test_stop_during_call() {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    ScriptedService service([&](const std::string& id, int) {
        entered = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return one_segment(id);
    });

    QueueConfig config = fast_config();
    config.max_concurrency = 1;

    TranscriptionQueue queue(service, config);
    Collector collector;
    queue.add_observer(&collector);
    for (int i = 0; i < 3; ++i) {
        queue.enqueue(make_chunk("h" + std::to_string(i), i, i * 5.0, i * 5.0 + 5.0), 3);
    }
    queue.start();

    while (!entered) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    // stop() blocks until the in-flight call returns.
    std::thread stopper([&] { queue.stop(); });
    while (queue.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    release = true;
    stopper.join();

    assert(service.calls() == 1);
    assert(collector.results.size() == 1);
    assert(collector.results[0].chunk_id == "h0");
    assert(collector.results[0].status == ChunkStatus::completed);

    QueueStats stats = queue.get_stats();
    assert(stats.completed == 1);
    assert(stats.pending == 2);
    assert(stats.processing == 0);

    std::cout << "[PASS] test_stop_during_call" << std::endl;
}

void test_placeholder_skips_service() {
    ScriptedService service([](const std::string& id, int) { return one_segment(id); });

    TranscriptionQueue queue(service, fast_config());
    queue.start();

    AudioChunk placeholder = make_chunk("p1", 1, 5.0, 10.0);
    placeholder.kind = ChunkKind::live_placeholder;
    placeholder.audio_data.clear();
    queue.enqueue(placeholder);

    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    assert(service.calls() == 0);
    auto results = queue.get_results();
    assert(results.size() == 1);
    assert(results[0].status == ChunkStatus::completed);
    assert(results[0].segments.empty());

    std::cout << "[PASS] test_placeholder_skips_service" << std::endl;
}

void test_empty_audio_fails_without_retry() {
    ScriptedService service([](const std::string& id, int) { return one_segment(id); });

    TranscriptionQueue queue(service, fast_config());
    queue.start();

    AudioChunk empty = make_chunk("e0", 0, 0.0, 5.0);
    empty.audio_data.clear();
    queue.enqueue(empty);

    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    assert(service.calls() == 0);
    auto results = queue.get_results();
    assert(results.size() == 1);
    assert(results[0].status == ChunkStatus::failed);
    assert(results[0].error_kind == ErrorKind::audio_quality);
    assert(results[0].error.rfind("[Chunk 1] ", 0) == 0);
    assert(!results[0].terminal);
    assert(queue.get_item("e0")->retry_count == 0);
    assert(queue.get_failed_items().size() == 1);

    std::cout << "[PASS] test_empty_audio_fails_without_retry" << std::endl;
}

void test_priority_order() {
    ScriptedService service([](const std::string& id, int) { return one_segment(id); });

    QueueConfig config = fast_config();
    config.max_concurrency = 1;

    TranscriptionQueue queue(service, config);
    queue.enqueue(make_chunk("s2", 2, 10.0, 15.0), 3);
    queue.enqueue(make_chunk("s0", 0, 0.0, 5.0), 3);
    queue.enqueue(make_chunk("s1", 1, 5.0, 10.0), 3);

    assert(queue.get_item("s0")->priority == 3);
    assert(queue.get_item("s2")->priority == 1);

    queue.start();
    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    std::vector<std::string> expected = {"s0", "s1", "s2"};
    assert(service.order() == expected);

    std::cout << "[PASS] test_priority_order" << std::endl;
}

void test_retry_delay() {
    assert(TranscriptionQueue::retry_delay_ms(1, 1000, 5000) == 1000);
    assert(TranscriptionQueue::retry_delay_ms(2, 1000, 5000) == 2000);
    assert(TranscriptionQueue::retry_delay_ms(3, 1000, 5000) == 4000);
    assert(TranscriptionQueue::retry_delay_ms(4, 1000, 5000) == 5000);
    assert(TranscriptionQueue::retry_delay_ms(10, 1000, 5000) == 5000);

    std::cout << "[PASS] test_retry_delay" << std::endl;
}

void test_confidence() {
    ScriptedService service([](const std::string& id, int) {
        TranscriptionResponse r = one_segment(id);
        if (id == "scored") {
            r.segments[0].confidence = 0.6;
            TranscriptionSegment s;
            s.start = 2.0;
            s.end = 3.0;
            s.text = "unscored";
            r.segments.push_back(s);
        }
        return r;
    });

    TranscriptionQueue queue(service, fast_config());
    queue.start();
    queue.enqueue(make_chunk("plain", 0, 0.0, 5.0));
    queue.enqueue(make_chunk("scored", 1, 5.0, 10.0));
    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    for (const auto& r : queue.get_completed_results()) {
        if (r.chunk_id == "plain") {
            assert(r.confidence == 0.8);
            assert(r.segments[0].confidence == 0.8);
        } else {
            assert(r.confidence == 0.6);
            assert(r.segments[1].confidence == 0.6);
        }
    }

    std::cout << "[PASS] test_confidence" << std::endl;
}

void test_error_classification() {
    ScriptedService service([](const std::string&, int) -> TranscriptionResponse {
        throw std::runtime_error("socket closed");
    });

    QueueConfig config = fast_config();
    config.max_retries = 1;

    TranscriptionQueue queue(service, config);
    queue.start();
    queue.enqueue(make_chunk("n0", 0, 0.0, 5.0));
    assert(queue.wait_idle(std::chrono::seconds(5)));
    queue.stop();

    auto results = queue.get_results();
    assert(results.size() == 1);
    assert(results[0].error_kind == ErrorKind::network_error);
    assert(queue.get_item("n0")->retry_count == 1);
    assert(service.calls() == 2);

    assert(classify_error("Connection refused") == ErrorKind::service_unavailable);
    assert(classify_error("request timed out") == ErrorKind::timeout);
    assert(classify_error("No such file or directory") == ErrorKind::file_error);
    assert(classify_error("weird") == ErrorKind::unknown);

    std::cout << "[PASS] test_error_classification" << std::endl;
}

int main() {
    std::cout << "=== TranscriptionQueue Tests ===" << std::endl;

    test_retry_then_success();
    test_circuit_breaker();
    test_breaker_needs_failures_inside_window();
    test_success_resets_breaker();
    test_temp_files_removed();
    test_stop_during_call();
    test_placeholder_skips_service();
    test_empty_audio_fails_without_retry();
    test_priority_order();
    test_retry_delay();
    test_confidence();
    test_error_classification();

    fs::remove_all(fs::temp_directory_path() / "cs_queue_test");

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
