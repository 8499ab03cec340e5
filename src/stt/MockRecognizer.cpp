/**
 * MockRecognizer.cpp - Energy-gated scripted recognizer
 */

#include "vsp/stt/MockRecognizer.hpp"
#include "vsp/audio/Pcm.hpp"

#include <atomic>
#include <iostream>

namespace vsp::stt {

namespace {

std::atomic<uint64_t> g_next_handle{1};

} // anonymous namespace

struct MockRecognizer::Impl {
    core::RecognizerConfig config;
    EventCallback callback;
    uint64_t handle = 0;

    bool in_speech = false;
    int speech_ms = 0;
    int silence_ms = 0;
    size_t script_index = 0;

    void emit(const RecognizerEvent& event) {
        if (callback) callback(SessionHandle{handle}, event);
    }

    void onBlock(float level, int block_ms) {
        bool voiced = level >= config.mock_energy_threshold;

        if (voiced) {
            if (!in_speech) {
                in_speech = true;
                speech_ms = 0;
                RecognizerEvent started;
                started.type = RecognizerEvent::Type::SpeechStarted;
                emit(started);
            }
            speech_ms += block_ms;
            silence_ms = 0;
            return;
        }

        if (!in_speech) return;

        silence_ms += block_ms;
        if (silence_ms < config.endpoint_silence_ms) return;

        in_speech = false;
        silence_ms = 0;
        if (speech_ms < config.min_speech_ms || config.mock_script.empty()) return;

        RecognizerEvent final_event;
        final_event.type = RecognizerEvent::Type::Transcript;
        final_event.text = config.mock_script[script_index++ % config.mock_script.size()];
        final_event.confidence = 0.95f;
        final_event.is_final = true;
        final_event.speech_final = true;
        emit(final_event);
    }
};

MockRecognizer::MockRecognizer()
    : impl_(std::make_unique<Impl>()) {
}

MockRecognizer::~MockRecognizer() = default;

SessionHandle MockRecognizer::start(const core::RecognizerConfig& config) {
    impl_->config = config;
    impl_->handle = g_next_handle++;
    impl_->in_speech = false;
    impl_->silence_ms = 0;
    std::cout << "[MockRecognizer] Started with " << config.mock_script.size()
              << " scripted utterances" << std::endl;
    return SessionHandle{impl_->handle};
}

bool MockRecognizer::send(const uint8_t* data, size_t size) {
    if (impl_->handle == 0) return false;

    std::vector<float> samples = audio::pcm16ToFloat(data, size);
    int rate = impl_->config.format.sample_rate > 0 ? impl_->config.format.sample_rate : 16000;
    int block_ms = static_cast<int>(samples.size() * 1000 / rate);
    impl_->onBlock(audio::rms(samples.data(), samples.size()), block_ms);
    return true;
}

void MockRecognizer::on(EventCallback callback) {
    impl_->callback = std::move(callback);
}

void MockRecognizer::stop() {
    if (impl_->handle == 0) return;

    RecognizerEvent closed;
    closed.type = RecognizerEvent::Type::Closed;
    impl_->emit(closed);
    impl_->handle = 0;
}

} // namespace vsp::stt
