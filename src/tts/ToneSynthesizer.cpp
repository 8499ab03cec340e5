/**
 * ToneSynthesizer.cpp - One short tone per word
 */

#include "vsp/tts/ToneSynthesizer.hpp"
#include "vsp/audio/Pcm.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace vsp::tts {

ToneSynthesizer::ToneSynthesizer(const core::SynthesisConfig& config)
    : format_(config.format)
    , chunk_ms_(config.chunk_ms > 0 ? config.chunk_ms : 100) {
}

bool ToneSynthesizer::synthesize(const std::string& text, const AudioCallback& onAudio) {
    cancelled_ = false;

    std::istringstream words(text);
    std::string word;
    size_t word_count = 0;
    while (words >> word) word_count++;
    if (word_count == 0) return true;

    const size_t total = static_cast<size_t>(format_.sample_rate) * WORD_MS * word_count / 1000;
    const size_t per_chunk = static_cast<size_t>(format_.sample_rate) * chunk_ms_ / 1000;
    const size_t per_word = static_cast<size_t>(format_.sample_rate) * WORD_MS / 1000;
    const float two_pi = 6.2831853f;

    std::vector<float> block;
    for (size_t start = 0; start < total; start += per_chunk) {
        if (cancelled_) return true;

        size_t count = std::min(per_chunk, total - start);
        block.assign(count, 0.0f);
        for (size_t i = 0; i < count; i++) {
            size_t n = start + i;
            // Alternate pitch per word, short gap at the end of each word
            float freq = (n / per_word) % 2 == 0 ? 440.0f : 523.25f;
            bool gap = n % per_word > per_word * 8 / 10;
            block[i] = gap ? 0.0f : 0.2f * std::sin(two_pi * freq * n / format_.sample_rate);
        }

        auto pcm = audio::floatToPcm16(block.data(), block.size());
        if (!onAudio(pcm.data(), pcm.size())) return true;
    }
    return true;
}

void ToneSynthesizer::cancel() {
    cancelled_ = true;
}

} // namespace vsp::tts
