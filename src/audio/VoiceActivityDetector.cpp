/**
 * VoiceActivityDetector.cpp - Utterance segmentation on top of fvad_process()
 */

#include "vsp/audio/VoiceActivityDetector.hpp"

#include <fvad.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <iostream>

namespace vsp::audio {

struct VoiceActivityDetector::Impl {
    SegmenterConfig config;
    Fvad* fvad = nullptr;

    size_t frame_len = 0;
    int hangover_frames = 0;
    int min_voiced_frames = 0;
    size_t preroll_frames = 0;
    size_t max_segment_len = 0;

    std::vector<float> pending;             // less than one frame
    std::deque<std::vector<float>> preroll; // unvoiced frames before onset
    std::vector<int16_t> scratch;

    bool open = false;
    SpeechSegment current;
    int voiced_frames = 0;
    int unvoiced_run = 0;

    OnsetHandler on_onset;
    SegmentHandler on_segment;

    explicit Impl(const SegmenterConfig& cfg) : config(cfg) {
        int frame_ms = std::max(1, config.frame_ms);
        frame_len = static_cast<size_t>(config.sample_rate) * frame_ms / 1000;
        hangover_frames = std::max(1, config.hangover_ms / frame_ms);
        min_voiced_frames = config.min_speech_ms / frame_ms;
        preroll_frames = static_cast<size_t>(std::max(0, config.preroll_ms / frame_ms));
        max_segment_len = static_cast<size_t>(config.sample_rate) * std::max(0, config.max_segment_ms) / 1000;
        scratch.resize(frame_len);
    }

    ~Impl() {
        if (fvad) fvad_free(fvad);
    }

    bool create() {
        fvad = fvad_new();
        if (!fvad) {
            std::cerr << "[VoiceActivityDetector] fvad_new failed" << std::endl;
            return false;
        }
        if (fvad_set_sample_rate(fvad, config.sample_rate) < 0) {
            std::cerr << "[VoiceActivityDetector] Unsupported sample rate " << config.sample_rate << std::endl;
            release();
            return false;
        }
        if (fvad_set_mode(fvad, std::clamp(config.aggressiveness, 0, 3)) < 0) {
            std::cerr << "[VoiceActivityDetector] Could not set aggressiveness" << std::endl;
            release();
            return false;
        }
        if (config.frame_ms != 10 && config.frame_ms != 20 && config.frame_ms != 30) {
            std::cerr << "[VoiceActivityDetector] Frame length must be 10, 20 or 30 ms" << std::endl;
            release();
            return false;
        }
        return true;
    }

    void release() {
        if (fvad) fvad_free(fvad);
        fvad = nullptr;
    }

    /// Returns 1 voiced, 0 unvoiced, -1 on a libfvad error.
    int classify(const float* frame) {
        for (size_t i = 0; i < frame_len; ++i) {
            float s = std::clamp(frame[i], -1.0f, 1.0f);
            scratch[i] = static_cast<int16_t>(std::lround(s * 32767.0f));
        }
        return fvad_process(fvad, scratch.data(), frame_len);
    }

    void close(bool truncated) {
        SpeechSegment done = std::move(current);
        current = SpeechSegment{};
        done.voiced_ms = voiced_frames * config.frame_ms;
        done.truncated = truncated;

        bool long_enough = voiced_frames >= min_voiced_frames;
        open = false;
        voiced_frames = 0;
        unvoiced_run = 0;

        if (long_enough && on_segment) on_segment(std::move(done));
    }

    void step(const float* frame) {
        int verdict = classify(frame);
        if (verdict < 0) {
            std::cerr << "[VoiceActivityDetector] fvad_process failed" << std::endl;
            return;
        }

        if (!open) {
            if (verdict == 0) {
                if (preroll_frames == 0) return;
                preroll.emplace_back(frame, frame + frame_len);
                if (preroll.size() > preroll_frames) preroll.pop_front();
                return;
            }
            open = true;
            for (const auto& earlier : preroll) {
                current.samples.insert(current.samples.end(), earlier.begin(), earlier.end());
            }
            preroll.clear();
            if (on_onset) on_onset();
        }

        current.samples.insert(current.samples.end(), frame, frame + frame_len);
        if (verdict == 1) {
            voiced_frames++;
            unvoiced_run = 0;
        } else if (++unvoiced_run >= hangover_frames) {
            close(false);
            return;
        }

        if (max_segment_len > 0 && current.samples.size() >= max_segment_len) {
            close(true);
        }
    }
};

VoiceActivityDetector::VoiceActivityDetector(const SegmenterConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    impl_->create();
}

VoiceActivityDetector::~VoiceActivityDetector() = default;

bool VoiceActivityDetector::isReady() const {
    return impl_->fvad != nullptr;
}

void VoiceActivityDetector::onOnset(OnsetHandler handler) {
    impl_->on_onset = std::move(handler);
}

void VoiceActivityDetector::onSegment(SegmentHandler handler) {
    impl_->on_segment = std::move(handler);
}

void VoiceActivityDetector::feed(const float* samples, size_t count) {
    if (!impl_->fvad || impl_->frame_len == 0) return;

    auto& pending = impl_->pending;
    pending.insert(pending.end(), samples, samples + count);

    size_t offset = 0;
    while (pending.size() - offset >= impl_->frame_len) {
        impl_->step(pending.data() + offset);
        offset += impl_->frame_len;
    }
    pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(offset));
}

void VoiceActivityDetector::flush() {
    if (impl_->open) impl_->close(false);
}

bool VoiceActivityDetector::inSegment() const {
    return impl_->open;
}

void VoiceActivityDetector::reset() {
    impl_->pending.clear();
    impl_->preroll.clear();
    impl_->current = SpeechSegment{};
    impl_->open = false;
    impl_->voiced_frames = 0;
    impl_->unvoiced_run = 0;
    if (impl_->fvad) fvad_reset(impl_->fvad);
}

} // namespace vsp::audio
