/**
 * VoiceActivityDetector.hpp - libfvad speech segmenter for the local recognizer
 *
 * Turns a continuous 16 kHz stream into utterance segments. A segment
 * opens on the first voiced frame (with a little pre-roll kept from
 * before it) and closes after hangover_ms of unvoiced frames, or when it
 * reaches max_segment_ms.
 */

#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace vsp::audio {

struct SegmenterConfig {
    int sample_rate = 16000;       // libfvad accepts 8, 16, 32 or 48 kHz
    int aggressiveness = 2;        // 0..3
    int frame_ms = 20;             // 10, 20 or 30
    int hangover_ms = 600;
    int min_speech_ms = 200;
    int preroll_ms = 100;
    int max_segment_ms = 15000;
};

struct SpeechSegment {
    std::vector<float> samples;
    int voiced_ms = 0;
    bool truncated = false;        // closed by max_segment_ms, not by silence

    int durationMs(int sample_rate) const {
        return static_cast<int>(samples.size() * 1000 / static_cast<size_t>(sample_rate));
    }
};

class VoiceActivityDetector {
public:
    using OnsetHandler = std::function<void()>;
    using SegmentHandler = std::function<void(SpeechSegment segment)>;

    explicit VoiceActivityDetector(const SegmenterConfig& config = SegmenterConfig{});
    ~VoiceActivityDetector();

    VoiceActivityDetector(const VoiceActivityDetector&) = delete;
    VoiceActivityDetector& operator=(const VoiceActivityDetector&) = delete;

    bool isReady() const;

    void onOnset(OnsetHandler handler);
    void onSegment(SegmentHandler handler);

    /// Accepts any block length; frames are cut internally.
    void feed(const float* samples, size_t count);

    /// Closes an open segment as if silence had been reached.
    void flush();

    bool inSegment() const;
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::audio
