/**
 * SpeechSynthesizer.hpp - Capability contract every TTS vendor adapter implements
 */

#pragma once

#include "vsp/core/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace vsp::tts {

class SpeechSynthesizer {
public:
    /// Receives PCM16 audio in the synthesizer's format as it is produced.
    /// Returning false asks the synthesizer to abandon the request.
    using AudioCallback = std::function<bool(const uint8_t* data, size_t size)>;

    virtual ~SpeechSynthesizer() = default;

    /// Opens (or re-opens) the upstream handle.
    virtual bool connect() = 0;

    /// Streams `text` as audio through `onAudio`. Blocks until the request
    /// completes, is abandoned or is cancelled. Returns false only on an
    /// upstream fault; a cancelled request returns true.
    virtual bool synthesize(const std::string& text, const AudioCallback& onAudio) = 0;

    /// Aborts the in-flight synthesize() call. Safe from any thread.
    virtual void cancel() = 0;

    virtual AudioFormat format() const = 0;
    virtual std::string name() const = 0;
};

} // namespace vsp::tts
