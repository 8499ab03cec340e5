/**
 * WhisperRecognizer.hpp - Local SpeechRecognizer on whisper.cpp + libfvad
 *
 * whisper.cpp is a batch decoder, so streaming is emulated: libfvad marks
 * speech onset (SpeechStarted) and, after trailing silence, the buffered
 * segment is decoded and reported as one final, speech_final transcript.
 */

#pragma once

#include "vsp/stt/SpeechRecognizer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vsp::stt {

class WhisperRecognizer : public SpeechRecognizer {
public:
    WhisperRecognizer();
    ~WhisperRecognizer() override;

    SessionHandle start(const core::RecognizerConfig& config) override;
    bool send(const uint8_t* data, size_t size) override;
    void on(EventCallback callback) override;
    void stop() override;
    std::string name() const override { return "whisper"; }

    /// Loads the model without opening a session. start() calls it too.
    bool load(const core::RecognizerConfig& config);
    bool isModelLoaded() const;

    /// Synchronous decode of 16 kHz float audio. Exposed for tests.
    std::string transcribe(const std::vector<float>& audio, float* confidence = nullptr);

    static constexpr int SAMPLE_RATE = 16000;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::stt
