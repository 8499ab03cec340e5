/**
 * Pcm.cpp - PCM helpers shared by the synthesizers and the local transport
 */

#include "vsp/audio/Pcm.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

namespace vsp::audio {

namespace {

uint16_t readU16(const std::vector<uint8_t>& b, size_t at) {
    return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

uint32_t readU32(const std::vector<uint8_t>& b, size_t at) {
    return static_cast<uint32_t>(b[at]) | (static_cast<uint32_t>(b[at + 1]) << 8) |
           (static_cast<uint32_t>(b[at + 2]) << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

bool tagAt(const std::vector<uint8_t>& b, size_t at, const char* tag) {
    return at + 4 <= b.size() && std::memcmp(&b[at], tag, 4) == 0;
}

} // anonymous namespace

std::vector<float> pcm16ToFloat(const uint8_t* data, size_t size) {
    std::vector<float> samples(size / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        int16_t s = static_cast<int16_t>(data[2 * i] | (data[2 * i + 1] << 8));
        samples[i] = static_cast<float>(s) / 32768.0f;
    }
    return samples;
}

std::vector<uint8_t> floatToPcm16(const float* samples, size_t count) {
    std::vector<uint8_t> bytes(count * 2);
    for (size_t i = 0; i < count; ++i) {
        float clamped = std::clamp(samples[i], -1.0f, 1.0f);
        auto s = static_cast<int16_t>(clamped * 32767.0f);
        bytes[2 * i] = static_cast<uint8_t>(s & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>((s >> 8) & 0xFF);
    }
    return bytes;
}

std::vector<float> resample(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }

    double ratio = static_cast<double>(to_rate) / from_rate;
    size_t new_size = samples.size() * static_cast<size_t>(to_rate) / static_cast<size_t>(from_rate);
    std::vector<float> out(new_size);

    for (size_t i = 0; i < new_size; ++i) {
        double src_pos = i / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            out[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else if (idx < samples.size()) {
            out[i] = samples[idx];
        }
    }
    return out;
}

float rms(const float* samples, size_t count) {
    if (count == 0) return 0.0f;
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / count));
}

std::optional<WavData> parseWav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 44 || !tagAt(bytes, 0, "RIFF") || !tagAt(bytes, 8, "WAVE")) {
        std::cerr << "[Pcm] Invalid WAV: no RIFF/WAVE header" << std::endl;
        return std::nullopt;
    }

    uint16_t audio_format = 0;
    uint16_t bits = 0;
    WavData wav;
    size_t data_offset = 0;
    size_t data_size = 0;

    // Walk the chunk list; headers are not always 44 bytes
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = readU32(bytes, pos + 4);
        if (tagAt(bytes, pos, "fmt ") && pos + 24 <= bytes.size()) {
            audio_format = readU16(bytes, pos + 8);
            wav.channels = readU16(bytes, pos + 10);
            wav.sample_rate = static_cast<int>(readU32(bytes, pos + 12));
            bits = readU16(bytes, pos + 22);
        } else if (tagAt(bytes, pos, "data")) {
            data_offset = pos + 8;
            data_size = std::min<size_t>(chunk_size, bytes.size() - data_offset);
            break;
        }
        pos += 8 + chunk_size + (chunk_size & 1);
    }

    if (data_offset == 0 || wav.channels <= 0 || wav.sample_rate <= 0) {
        std::cerr << "[Pcm] Invalid WAV: missing fmt or data chunk" << std::endl;
        return std::nullopt;
    }

    const uint8_t* data = &bytes[data_offset];
    const size_t frame_bytes = static_cast<size_t>(bits / 8) * wav.channels;
    if (frame_bytes == 0) return std::nullopt;
    const size_t frames = data_size / frame_bytes;
    wav.samples.resize(frames);

    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* p = data + i * frame_bytes;
        if (bits == 16 && audio_format == 1) {
            wav.samples[i] = static_cast<float>(static_cast<int16_t>(p[0] | (p[1] << 8))) / 32768.0f;
        } else if (bits == 24 && audio_format == 1) {
            int32_t val = (p[0] << 8) | (p[1] << 16) | (p[2] << 24);
            val >>= 8;
            wav.samples[i] = static_cast<float>(val) / 8388608.0f;
        } else if (bits == 32 && audio_format == 3) {
            float f;
            std::memcpy(&f, p, sizeof(float));
            wav.samples[i] = f;
        } else {
            std::cerr << "[Pcm] Unsupported WAV format: " << bits << " bits, format "
                      << audio_format << std::endl;
            return std::nullopt;
        }
    }

    return wav;
}

} // namespace vsp::audio
