/**
 * SpeechSynthesisStream.hpp - Reply text to an ordered, bounded chunk stream
 *
 * A background worker drives the SpeechSynthesizer and cuts its output into
 * fixed-duration SynthesisChunks. The lookahead between production and
 * delivery never exceeds the configured horizon, which bounds how much
 * audio is thrown away on interruption.
 *
 * Each response gets consecutive sequence numbers starting at 0 and exactly
 * one chunk with is_last set. After cancel() returns, next() yields nothing
 * that belongs to a cancelled response.
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/core/Types.hpp"
#include "vsp/tts/SpeechSynthesizer.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vsp::tts {

class SpeechSynthesisStream {
public:
    using FailureCallback = std::function<void(uint64_t response_id, const std::string& reason)>;

    SpeechSynthesisStream(std::unique_ptr<SpeechSynthesizer> synthesizer,
                          const core::SynthesisConfig& config);
    ~SpeechSynthesisStream();

    SpeechSynthesisStream(const SpeechSynthesisStream&) = delete;
    SpeechSynthesisStream& operator=(const SpeechSynthesisStream&) = delete;

    /// Connects the synthesizer and starts the worker.
    bool start();

    /// Starts a new response, cancelling whatever was in progress.
    void synthesize(uint64_t response_id, const std::string& text);

    /// Next chunk in order, or nullopt after `timeout` / shutdown.
    std::optional<SynthesisChunk> next(std::chrono::milliseconds timeout);

    /// Stops the active response. Safe from any thread at any time.
    void cancel();

    void shutdown();

    /// Called from the worker when the synthesizer fails twice in a row.
    void setFailureCallback(FailureCallback callback);

    bool isActive() const;
    size_t bufferedBytes() const;
    size_t horizonBytes() const;
    AudioFormat format() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::tts
