/**
 * SpeechSynthesisStream.cpp - Bounded lookahead pipeline from synthesizer to client
 *
 * The worker produces, the session's output loop consumes through next().
 * A generation counter guarded by the stream mutex decides which chunks are
 * still wanted: cancel() bumps it and clears the lookahead in one critical
 * section, so a chunk from an old generation can never be handed out later.
 */

#include "vsp/tts/SpeechSynthesisStream.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace vsp::tts {

namespace {

struct Job {
    uint64_t generation = 0;
    uint64_t response_id = 0;
    std::string text;
};

} // anonymous namespace

struct SpeechSynthesisStream::Impl {
    std::unique_ptr<SpeechSynthesizer> synthesizer;
    core::SynthesisConfig config;
    AudioFormat format;
    size_t chunk_bytes = 0;
    size_t horizon_bytes = 0;

    mutable std::mutex mutex;
    std::condition_variable job_cv;
    std::condition_variable space_cv;
    std::condition_variable chunk_cv;

    std::optional<Job> pending_job;
    std::deque<SynthesisChunk> ready;
    size_t ready_bytes = 0;
    std::optional<SynthesisChunk> held;   // withheld until we know whether it is the last
    uint64_t generation = 0;
    uint64_t running_generation = 0;
    uint64_t next_sequence = 0;
    bool producing = false;
    bool stopping = false;

    std::vector<uint8_t> partial;         // worker only
    std::thread worker;
    FailureCallback on_failure;

    Impl(std::unique_ptr<SpeechSynthesizer> synth, const core::SynthesisConfig& cfg)
        : synthesizer(std::move(synth)), config(cfg) {
        format = synthesizer->format();
        chunk_bytes = std::max<size_t>(format.bytesFor(std::chrono::milliseconds(config.chunk_ms)), 2);
        horizon_bytes = std::max(format.bytesFor(std::chrono::milliseconds(config.horizon_ms)), chunk_bytes);
    }

    void cancelLocked() {
        ++generation;
        ready.clear();
        ready_bytes = 0;
        held.reset();
        pending_job.reset();
        producing = false;
        if (running_generation != 0) {
            synthesizer->cancel();
        }
        space_cv.notify_all();
    }

    bool isCurrent(const Job& job) const {
        std::lock_guard<std::mutex> lock(mutex);
        return !stopping && job.generation == generation;
    }

    bool enqueue(const Job& job, std::vector<uint8_t> bytes) {
        std::unique_lock<std::mutex> lock(mutex);
        space_cv.wait(lock, [&]() {
            if (stopping || job.generation != generation || ready.empty()) return true;
            size_t held_bytes = held ? held->payload.size() : 0;
            return ready_bytes + held_bytes + bytes.size() <= horizon_bytes;
        });
        if (stopping || job.generation != generation) return false;

        if (held) {
            ready_bytes += held->payload.size();
            ready.push_back(std::move(*held));
            held.reset();
            chunk_cv.notify_one();
        }

        SynthesisChunk chunk;
        chunk.response_id = job.response_id;
        chunk.sequence = next_sequence++;
        chunk.payload = std::move(bytes);
        held = std::move(chunk);
        return true;
    }

    bool deliver(const Job& job, const uint8_t* data, size_t size) {
        partial.insert(partial.end(), data, data + size);
        while (partial.size() >= chunk_bytes) {
            std::vector<uint8_t> piece(partial.begin(), partial.begin() + chunk_bytes);
            partial.erase(partial.begin(), partial.begin() + chunk_bytes);
            if (!enqueue(job, std::move(piece))) return false;
        }
        return isCurrent(job);
    }

    void finish(const Job& job) {
        if (!partial.empty()) {
            if (!enqueue(job, std::move(partial))) return;
            partial.clear();
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (stopping || job.generation != generation) return;

        if (!held) {
            SynthesisChunk empty;
            empty.response_id = job.response_id;
            empty.sequence = next_sequence++;
            held = std::move(empty);
        }
        held->is_last = true;
        ready_bytes += held->payload.size();
        ready.push_back(std::move(*held));
        held.reset();
        producing = false;
        chunk_cv.notify_one();
    }

    void fail(const Job& job, const std::string& reason) {
        FailureCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping || job.generation != generation) return;
            producing = false;
            held.reset();
            callback = on_failure;
        }
        std::cerr << "[SpeechSynthesisStream] " << reason << std::endl;
        if (callback) callback(job.response_id, reason);
    }

    void runJob(const Job& job) {
        partial.clear();
        bool delivered_any = false;

        SpeechSynthesizer::AudioCallback onAudio = [&](const uint8_t* data, size_t size) {
            delivered_any = true;
            return deliver(job, data, size);
        };

        bool ok = synthesizer->synthesize(job.text, onAudio);

        // One reconnect, and only when nothing reached the client yet
        if (!ok && !delivered_any && isCurrent(job)) {
            std::cerr << "[SpeechSynthesisStream] " << synthesizer->name()
                      << " failed, reconnecting..." << std::endl;
            if (synthesizer->connect()) {
                ok = synthesizer->synthesize(job.text, onAudio);
            }
        }

        if (!ok) {
            fail(job, synthesizer->name() + " synthesis failed");
            return;
        }
        finish(job);
    }

    void run() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex);
                job_cv.wait(lock, [this]() { return stopping || pending_job.has_value(); });
                if (stopping) break;

                job = std::move(*pending_job);
                pending_job.reset();
                if (job.generation != generation) continue;
                running_generation = job.generation;
            }

            runJob(job);

            std::lock_guard<std::mutex> lock(mutex);
            running_generation = 0;
        }
    }
};

SpeechSynthesisStream::SpeechSynthesisStream(std::unique_ptr<SpeechSynthesizer> synthesizer,
                                             const core::SynthesisConfig& config)
    : impl_(std::make_unique<Impl>(std::move(synthesizer), config)) {
}

SpeechSynthesisStream::~SpeechSynthesisStream() {
    shutdown();
}

bool SpeechSynthesisStream::start() {
    if (impl_->worker.joinable()) return true;

    if (!impl_->synthesizer->connect()) {
        std::cerr << "[SpeechSynthesisStream] Failed to connect " << impl_->synthesizer->name()
                  << std::endl;
        return false;
    }

    impl_->worker = std::thread([this]() { impl_->run(); });
    std::cout << "[SpeechSynthesisStream] Started " << impl_->synthesizer->name()
              << " (chunk=" << impl_->chunk_bytes << "B, horizon=" << impl_->horizon_bytes << "B)"
              << std::endl;
    return true;
}

void SpeechSynthesisStream::synthesize(uint64_t response_id, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;

        impl_->cancelLocked();
        Job job;
        job.generation = impl_->generation;
        job.response_id = response_id;
        job.text = text;
        impl_->pending_job = std::move(job);
        impl_->next_sequence = 0;
        impl_->producing = true;
    }
    impl_->job_cv.notify_one();
}

std::optional<SynthesisChunk> SpeechSynthesisStream::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->chunk_cv.wait_for(lock, timeout, [this]() {
        return impl_->stopping || !impl_->ready.empty();
    });
    if (impl_->stopping || impl_->ready.empty()) return std::nullopt;

    SynthesisChunk chunk = std::move(impl_->ready.front());
    impl_->ready.pop_front();
    impl_->ready_bytes -= chunk.payload.size();
    impl_->space_cv.notify_all();
    return chunk;
}

void SpeechSynthesisStream::cancel() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->cancelLocked();
}

void SpeechSynthesisStream::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->stopping = true;
        impl_->cancelLocked();
    }
    impl_->job_cv.notify_all();
    impl_->chunk_cv.notify_all();
    impl_->space_cv.notify_all();

    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

void SpeechSynthesisStream::setFailureCallback(FailureCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_failure = std::move(callback);
}

bool SpeechSynthesisStream::isActive() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->producing || !impl_->ready.empty();
}

size_t SpeechSynthesisStream::bufferedBytes() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->ready_bytes + (impl_->held ? impl_->held->payload.size() : 0);
}

size_t SpeechSynthesisStream::horizonBytes() const {
    return impl_->horizon_bytes;
}

AudioFormat SpeechSynthesisStream::format() const {
    return impl_->format;
}

} // namespace vsp::tts
