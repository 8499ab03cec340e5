/**
 * AudioIngestGateway.cpp - Bounded ingest queue and ingest loop
 */

#include "vsp/audio/AudioIngestGateway.hpp"
#include "vsp/core/Channel.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

namespace vsp::audio {

const char* toString(IngestStatus status) {
    switch (status) {
        case IngestStatus::Ok: return "ok";
        case IngestStatus::RecognizerUnavailable: return "recognizer_unavailable";
        case IngestStatus::Closed: return "closed";
    }
    return "unknown";
}

struct AudioIngestGateway::Impl {
    stt::TranscriptionStream& stream;
    core::IngestConfig config;
    core::Channel<std::vector<uint8_t>> queue;

    std::mutex callback_mutex;
    BackpressureCallback on_backpressure;

    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> dropped_backpressure{0};
    std::atomic<uint64_t> dropped_unavailable{0};

    std::atomic<bool> running{false};
    std::thread worker;

    Impl(stt::TranscriptionStream& s, const core::IngestConfig& cfg)
        : stream(s)
        , config(cfg)
        , queue(cfg.queueFrames(), core::OverflowPolicy::DropOldest) {
    }

    void run() {
        const auto poll = std::chrono::milliseconds(config.poll_ms);

        while (running) {
            auto frame = queue.popFor(poll);
            stream.service();

            if (!frame) {
                if (queue.closed()) break;
                continue;
            }

            if (stream.send(*frame)) {
                forwarded++;
            } else {
                dropped_unavailable++;
            }
        }
    }
};

AudioIngestGateway::AudioIngestGateway(stt::TranscriptionStream& stream, const core::IngestConfig& config)
    : impl_(std::make_unique<Impl>(stream, config)) {
}

AudioIngestGateway::~AudioIngestGateway() {
    stop();
}

void AudioIngestGateway::setBackpressureCallback(BackpressureCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_backpressure = std::move(callback);
}

void AudioIngestGateway::start() {
    if (impl_->running.exchange(true)) return;
    impl_->worker = std::thread([this]() { impl_->run(); });
    std::cout << "[AudioIngestGateway] Started (queue " << impl_->queue.capacity() << " frames)"
              << std::endl;
}

IngestStatus AudioIngestGateway::ingest(std::vector<uint8_t> frame) {
    if (impl_->queue.closed()) {
        return IngestStatus::Closed;
    }

    impl_->received++;

    if (!impl_->stream.isAvailable()) {
        impl_->dropped_unavailable++;
        return IngestStatus::RecognizerUnavailable;
    }

    core::PushResult result = impl_->queue.push(std::move(frame));
    if (!result.accepted) {
        return IngestStatus::Closed;
    }

    if (result.dropped > 0) {
        impl_->dropped_backpressure += result.dropped;

        BackpressureCallback callback;
        {
            std::lock_guard<std::mutex> lock(impl_->callback_mutex);
            callback = impl_->on_backpressure;
        }
        if (callback) callback(result.dropped);
    }
    return IngestStatus::Ok;
}

void AudioIngestGateway::stop() {
    impl_->queue.close();
    impl_->running = false;

    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
    impl_->queue.clear();
}

IngestCounters AudioIngestGateway::counters() const {
    IngestCounters counters;
    counters.received = impl_->received;
    counters.forwarded = impl_->forwarded;
    counters.dropped_backpressure = impl_->dropped_backpressure;
    counters.dropped_unavailable = impl_->dropped_unavailable;
    return counters;
}

size_t AudioIngestGateway::queued() const {
    return impl_->queue.size();
}

} // namespace vsp::audio
