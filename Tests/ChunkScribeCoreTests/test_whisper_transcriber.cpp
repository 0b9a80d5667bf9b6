/**
 * test_whisper_transcriber.cpp - Failure mapping without a model
 */

#include "WhisperTranscriber.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace cs;
namespace fs = std::filesystem;

void test_unloaded_model_is_unavailable() {
    WhisperTranscriber transcriber;
    assert(!transcriber.is_loaded());

    bool thrown = false;
    try {
        transcriber.transcribe("/nonexistent/chunk.webm");
    } catch (const TranscriptionError& e) {
        thrown = true;
        assert(e.kind() == ErrorKind::service_unavailable);
        assert(is_unreachable(e.kind()));
    }
    assert(thrown);

    std::cout << "[PASS] test_unloaded_model_is_unavailable" << std::endl;
}

void test_missing_model_file() {
    WhisperTranscriber transcriber;
    assert(!transcriber.load("/nonexistent/ggml-missing.bin"));
    assert(!transcriber.is_loaded());

    std::cout << "[PASS] test_missing_model_file" << std::endl;
}

void test_decoder_rejects_garbage() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path path = fs::temp_directory_path() / ("cs_garbage_" + std::to_string(stamp) + ".webm");
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not an audio container";
    }

    AudioConverter converter;
    bool thrown = false;
    try {
        converter.decode_to_pcm(path.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    fs::remove(path);
    std::cout << "[PASS] test_decoder_rejects_garbage" << std::endl;
}

int main() {
    std::cout << "=== WhisperTranscriber Tests ===" << std::endl;

    test_unloaded_model_is_unavailable();
    test_missing_model_file();
    test_decoder_rejects_garbage();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
