/**
 * test_whisper_recognizer.cpp - Local recognizer tests (whisper.cpp + libfvad)
 */

#include "vsp/audio/VoiceActivityDetector.hpp"
#include "vsp/stt/WhisperRecognizer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace vsp;

void test_vad_ignores_silence() {
    audio::VoiceActivityDetector vad;
    assert(vad.isReady());

    int onsets = 0;
    int segments = 0;
    vad.onOnset([&]() { onsets++; });
    vad.onSegment([&](audio::SpeechSegment) { segments++; });

    // Odd block sizes exercise the internal framing
    std::vector<float> silence(16000, 0.0f);
    vad.feed(silence.data(), 777);
    vad.feed(silence.data() + 777, silence.size() - 777);
    vad.flush();
    assert(onsets == 0);
    assert(segments == 0);
    assert(!vad.inSegment());

    std::cout << "[PASS] test_vad_ignores_silence" << std::endl;
}

void test_vad_rejects_bad_config() {
    audio::SegmenterConfig config;
    config.sample_rate = 22050;
    audio::VoiceActivityDetector bad_rate(config);
    assert(!bad_rate.isReady());

    config = audio::SegmenterConfig{};
    config.frame_ms = 25;
    audio::VoiceActivityDetector bad_frame(config);
    assert(!bad_frame.isReady());

    // Feeding an unusable detector is a no-op
    std::vector<float> block(320, 0.1f);
    bad_frame.feed(block.data(), block.size());
    assert(!bad_frame.inSegment());

    std::cout << "[PASS] test_vad_rejects_bad_config" << std::endl;
}

void test_missing_model() {
    core::RecognizerConfig config;
    config.model_path = "models/whisper/does-not-exist.bin";

    stt::WhisperRecognizer recognizer;
    assert(!recognizer.start(config).valid());
    assert(!recognizer.isModelLoaded());
    assert(!recognizer.send(nullptr, 0));

    std::cout << "[PASS] test_missing_model" << std::endl;
}

void test_transcribe_silence() {
    core::RecognizerConfig config;
    stt::WhisperRecognizer recognizer;

    if (!recognizer.load(config)) {
        std::cout << "[SKIP] test_transcribe_silence (model not available at "
                  << config.model_path << ")" << std::endl;
        return;
    }

    std::vector<float> silence(stt::WhisperRecognizer::SAMPLE_RATE, 0.0f);
    float confidence = -1.0f;
    std::string text = recognizer.transcribe(silence, &confidence);
    std::cout << "  Result: \"" << text << "\"" << std::endl;
    assert(confidence >= 0.0f && confidence <= 1.0f);

    std::cout << "[PASS] test_transcribe_silence" << std::endl;
}

void test_session_lifecycle() {
    core::RecognizerConfig config;
    stt::WhisperRecognizer recognizer;

    if (!recognizer.load(config)) {
        std::cout << "[SKIP] test_session_lifecycle (model not available)" << std::endl;
        return;
    }

    int closed = 0;
    recognizer.on([&](stt::SessionHandle, const stt::RecognizerEvent& event) {
        if (event.type == stt::RecognizerEvent::Type::Closed) closed++;
    });

    stt::SessionHandle first = recognizer.start(config);
    assert(first.valid());

    std::vector<uint8_t> quiet(640, 0);
    assert(recognizer.send(quiet.data(), quiet.size()));

    stt::SessionHandle second = recognizer.start(config);
    assert(second.valid());
    assert(second != first);
    assert(closed == 1);

    recognizer.stop();
    assert(closed == 2);
    assert(!recognizer.send(quiet.data(), quiet.size()));

    std::cout << "[PASS] test_session_lifecycle" << std::endl;
}

int main() {
    std::cout << "=== WhisperRecognizer Tests ===" << std::endl;

    test_vad_ignores_silence();
    test_vad_rejects_bad_config();
    test_missing_model();
    test_transcribe_silence();
    test_session_lifecycle();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
