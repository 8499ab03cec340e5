/**
 * SpeechRecognizer.hpp - Capability contract every STT vendor adapter implements
 *
 * Adapters may invoke the event callback from any thread. Every event is
 * tagged with the handle of the upstream session that produced it so stale
 * events from a replaced session can be told apart.
 */

#pragma once

#include "vsp/core/Config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace vsp::stt {

struct SessionHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    bool operator==(const SessionHandle& other) const { return id == other.id; }
    bool operator!=(const SessionHandle& other) const { return id != other.id; }
};

/// Vendor-shaped event, before normalization.
struct RecognizerEvent {
    enum class Type {
        Transcript,     // interim or final hypothesis
        SpeechStarted,  // provider VAD onset
        UtteranceEnd,   // provider end-of-utterance without text
        Closed,         // upstream session ended
        Error
    };

    Type type = Type::Transcript;
    std::string text;
    float confidence = 0.0f;
    bool is_final = false;
    bool speech_final = false;
    std::string detail;
};

class SpeechRecognizer {
public:
    using EventCallback = std::function<void(SessionHandle, const RecognizerEvent&)>;

    virtual ~SpeechRecognizer() = default;

    /// Opens an upstream session. Returns an invalid handle on failure.
    virtual SessionHandle start(const core::RecognizerConfig& config) = 0;

    /// Forwards PCM16 audio. Returns false when the upstream session is gone.
    virtual bool send(const uint8_t* data, size_t size) = 0;

    /// Registers the event callback. Called before start().
    virtual void on(EventCallback callback) = 0;

    /// Closes the current upstream session. A Closed event caused by stop()
    /// is expected and must not be treated as a fault.
    virtual void stop() = 0;

    virtual std::string name() const = 0;
};

} // namespace vsp::stt
