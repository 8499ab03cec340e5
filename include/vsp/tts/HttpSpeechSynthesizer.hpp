/**
 * HttpSpeechSynthesizer.hpp - TTS adapter for a persistent synthesis server
 *
 * Talks to an XTTS-style server (POST /synthesize {"text"} -> WAV,
 * GET /health). Replies are split into sentences so the first audio is
 * ready after the first sentence rather than the whole reply.
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/tts/SpeechSynthesizer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vsp::tts {

class HttpSpeechSynthesizer : public SpeechSynthesizer {
public:
    explicit HttpSpeechSynthesizer(const core::SynthesisConfig& config);
    ~HttpSpeechSynthesizer() override;

    bool connect() override;
    bool synthesize(const std::string& text, const AudioCallback& onAudio) override;
    void cancel() override;
    AudioFormat format() const override;
    std::string name() const override { return "http"; }

    static std::vector<std::string> splitSentences(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::tts
