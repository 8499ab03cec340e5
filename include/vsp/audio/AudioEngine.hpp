/**
 * AudioEngine.hpp - PortAudio device pair for the local client transport
 *
 * Capture delivers little-endian PCM16 frames in the ingest format.
 * Playback accepts PCM16 bytes in the synthesis format. The two sides
 * are separate streams because the rates differ.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vsp::audio {

/// Invoked on the PortAudio capture thread with one frame of PCM16 bytes.
using CaptureCallback = std::function<void(std::vector<uint8_t> frame)>;

struct DeviceConfig {
    int capture_rate = 16000;
    int playback_rate = 24000;
    int capture_frame_ms = 20;
    int capture_device = -1;         // -1 = system default
    int playback_device = -1;
    int playback_queue_ms = 10000;
};

class AudioEngine {
public:
    explicit AudioEngine(const DeviceConfig& config = DeviceConfig{});
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool open();
    bool start();
    void close();
    bool isStreaming() const;

    void onCapture(CaptureCallback callback);

    /// Queues PCM16 bytes for the speaker. Returns false when some were dropped.
    bool play(const std::vector<uint8_t>& pcm);

    /// Discards queued speaker audio.
    void flush();
    size_t queuedMs() const;

    struct DeviceInfo {
        int index = -1;
        std::string name;
        bool can_capture = false;
        bool can_play = false;
    };
    static std::vector<DeviceInfo> devices();

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::audio
