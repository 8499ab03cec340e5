/**
 * Pcm.hpp - PCM16 conversion, resampling and WAV parsing
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace vsp::audio {

std::vector<float> pcm16ToFloat(const uint8_t* data, size_t size);
std::vector<uint8_t> floatToPcm16(const float* samples, size_t count);

/// Linear interpolation resampler.
std::vector<float> resample(const std::vector<float>& samples, int from_rate, int to_rate);

/// Root-mean-square level of a block of samples.
float rms(const float* samples, size_t count);

struct WavData {
    int sample_rate = 0;
    int channels = 0;
    std::vector<float> samples;   // first channel only
};

/// Parses a RIFF/WAVE buffer carrying 16-bit PCM, 24-bit PCM or 32-bit
/// float samples. Returns nullopt for anything else.
std::optional<WavData> parseWav(const std::vector<uint8_t>& bytes);

} // namespace vsp::audio
