/**
 * AudioEngine.cpp - PortAudio capture and playback for vsp_local
 *
 * Both streams run in paInt16 so no float conversion happens on the
 * audio threads. The speaker side drains a lock-free ring of samples
 * that flush() empties on barge-in.
 */

#include "vsp/audio/AudioEngine.hpp"
#include "vsp/audio/RingBuffer.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>

namespace vsp::audio {

namespace {

constexpr int kChannels = 1;

} // anonymous namespace

struct AudioEngine::Impl {
    DeviceConfig config;
    RingBuffer<int16_t> speaker;

    PaStream* capture = nullptr;
    PaStream* playback = nullptr;
    bool pa_ready = false;
    std::atomic<bool> streaming{false};

    std::mutex capture_mutex;
    CaptureCallback on_capture;

    mutable std::mutex error_mutex;
    std::string error;

    explicit Impl(const DeviceConfig& cfg)
        : config(cfg),
          speaker(static_cast<size_t>(cfg.playback_rate) * cfg.playback_queue_ms / 1000) {}

    bool report(const std::string& what, PaError err = paNoError) {
        std::string message = what;
        if (err != paNoError) message += std::string(": ") + Pa_GetErrorText(err);
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            error = message;
        }
        std::cerr << "[AudioEngine] " << message << std::endl;
        return false;
    }

    void closeStream(PaStream*& stream) {
        if (!stream) return;
        if (Pa_IsStreamActive(stream) == 1) {
            PaError err = Pa_StopStream(stream);
            if (err != paNoError) report("Pa_StopStream failed", err);
        }
        PaError err = Pa_CloseStream(stream);
        if (err != paNoError) report("Pa_CloseStream failed", err);
        stream = nullptr;
    }

    /// Opens one direction. A negative device picks the host default.
    bool openStream(PaStream*& stream, bool for_capture) {
        int wanted = for_capture ? config.capture_device : config.playback_device;
        PaDeviceIndex device = wanted >= 0 ? wanted
            : (for_capture ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice());
        if (device == paNoDevice) {
            return report(for_capture ? "No capture device" : "No playback device");
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
        if (!info) {
            return report("Unknown device index " + std::to_string(device));
        }

        PaStreamParameters params{};
        params.device = device;
        params.channelCount = kChannels;
        params.sampleFormat = paInt16;
        params.suggestedLatency = for_capture ? info->defaultLowInputLatency
                                              : info->defaultLowOutputLatency;

        int rate = for_capture ? config.capture_rate : config.playback_rate;
        unsigned long frames = for_capture
            ? static_cast<unsigned long>(config.capture_rate * config.capture_frame_ms / 1000)
            : paFramesPerBufferUnspecified;

        PaError err = Pa_OpenStream(&stream,
                                    for_capture ? &params : nullptr,
                                    for_capture ? nullptr : &params,
                                    rate, frames, paClipOff,
                                    for_capture ? captureThunk : playbackThunk,
                                    this);
        if (err != paNoError) {
            stream = nullptr;
            return report(for_capture ? "Opening capture stream failed" : "Opening playback stream failed", err);
        }
        std::cout << "[AudioEngine] " << (for_capture ? "Capture" : "Playback") << " on '"
                  << info->name << "' at " << rate << "Hz" << std::endl;
        return true;
    }

    void deliverCapture(const int16_t* samples, unsigned long count) {
        std::vector<uint8_t> frame(count * 2);
        for (unsigned long i = 0; i < count; ++i) {
            uint16_t bits = static_cast<uint16_t>(samples[i]);
            frame[i * 2] = static_cast<uint8_t>(bits & 0xFF);
            frame[i * 2 + 1] = static_cast<uint8_t>(bits >> 8);
        }
        std::lock_guard<std::mutex> lock(capture_mutex);
        if (on_capture) on_capture(std::move(frame));
    }

    void fillPlayback(int16_t* out, unsigned long count) {
        size_t got = speaker.pop(out, count);
        std::fill(out + got, out + count, int16_t{0});
    }

    static int captureThunk(const void* input, void* /*output*/, unsigned long frames,
                            const PaStreamCallbackTimeInfo* /*time*/, PaStreamCallbackFlags /*flags*/,
                            void* user_data) {
        if (input) {
            static_cast<Impl*>(user_data)->deliverCapture(static_cast<const int16_t*>(input), frames);
        }
        return paContinue;
    }

    static int playbackThunk(const void* /*input*/, void* output, unsigned long frames,
                             const PaStreamCallbackTimeInfo* /*time*/, PaStreamCallbackFlags /*flags*/,
                             void* user_data) {
        static_cast<Impl*>(user_data)->fillPlayback(static_cast<int16_t*>(output), frames);
        return paContinue;
    }
};

AudioEngine::AudioEngine(const DeviceConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

AudioEngine::~AudioEngine() {
    close();
    if (impl_->pa_ready) {
        Pa_Terminate();
    }
}

bool AudioEngine::open() {
    if (impl_->pa_ready) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return impl_->report("Pa_Initialize failed", err);
    }
    impl_->pa_ready = true;

    if (!impl_->openStream(impl_->capture, true)) return false;
    if (!impl_->openStream(impl_->playback, false)) {
        impl_->closeStream(impl_->capture);
        return false;
    }
    return true;
}

bool AudioEngine::start() {
    if (impl_->streaming) return true;
    if (!open()) return false;

    PaError err = Pa_StartStream(impl_->playback);
    if (err != paNoError) {
        return impl_->report("Starting playback failed", err);
    }
    err = Pa_StartStream(impl_->capture);
    if (err != paNoError) {
        Pa_StopStream(impl_->playback);
        return impl_->report("Starting capture failed", err);
    }

    impl_->streaming = true;
    return true;
}

void AudioEngine::close() {
    impl_->streaming = false;
    impl_->closeStream(impl_->capture);
    impl_->closeStream(impl_->playback);
}

bool AudioEngine::isStreaming() const {
    return impl_->streaming;
}

void AudioEngine::onCapture(CaptureCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->capture_mutex);
    impl_->on_capture = std::move(callback);
}

bool AudioEngine::play(const std::vector<uint8_t>& pcm) {
    std::vector<int16_t> samples(pcm.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(pcm[i * 2] | (pcm[i * 2 + 1] << 8));
    }
    return impl_->speaker.push(samples.data(), samples.size()) == samples.size();
}

void AudioEngine::flush() {
    impl_->speaker.clear();
}

size_t AudioEngine::queuedMs() const {
    return impl_->speaker.available() * 1000 / static_cast<size_t>(impl_->config.playback_rate);
}

std::vector<AudioEngine::DeviceInfo> AudioEngine::devices() {
    std::vector<DeviceInfo> result;
    if (Pa_Initialize() != paNoError) return result;

    for (int i = 0; i < Pa_GetDeviceCount(); ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        DeviceInfo device;
        device.index = i;
        device.name = info->name;
        device.can_capture = info->maxInputChannels > 0;
        device.can_play = info->maxOutputChannels > 0;
        result.push_back(std::move(device));
    }

    Pa_Terminate();
    return result;
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->error;
}

} // namespace vsp::audio
