/**
 * ToneSynthesizer.hpp - Offline stand-in that "speaks" a tone per word
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/tts/SpeechSynthesizer.hpp"

#include <atomic>

namespace vsp::tts {

class ToneSynthesizer : public SpeechSynthesizer {
public:
    explicit ToneSynthesizer(const core::SynthesisConfig& config);

    bool connect() override { return true; }
    bool synthesize(const std::string& text, const AudioCallback& onAudio) override;
    void cancel() override;
    AudioFormat format() const override { return format_; }
    std::string name() const override { return "tone"; }

    static constexpr int WORD_MS = 180;

private:
    AudioFormat format_;
    int chunk_ms_;
    std::atomic<bool> cancelled_{false};
};

} // namespace vsp::tts
