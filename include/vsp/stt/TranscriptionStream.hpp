/**
 * TranscriptionStream.hpp - Normalizes a SpeechRecognizer into TranscriptEvents
 *
 * Owns the recognizer exclusively. start(), send(), service() and stop()
 * are called from the session's ingest loop only; vendor callbacks may
 * arrive on any thread and are forwarded to the event sink.
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/core/Types.hpp"
#include "vsp/stt/SpeechRecognizer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vsp::stt {

class TranscriptionStream {
public:
    using EventSink = std::function<void(const TranscriptEvent&)>;
    using FailureSink = std::function<void(const std::string& reason)>;

    TranscriptionStream(std::unique_ptr<SpeechRecognizer> recognizer,
                        core::RecognizerConfig config);
    ~TranscriptionStream();

    TranscriptionStream(const TranscriptionStream&) = delete;
    TranscriptionStream& operator=(const TranscriptionStream&) = delete;

    void setEventSink(EventSink sink);

    /// Receives the terminal RecognizerFailed outcome, at most once.
    void setFailureSink(FailureSink sink);

    bool start();

    /// Returns false when no upstream session is active.
    bool send(const std::vector<uint8_t>& audio);

    /// Performs a pending reconnect. Called periodically by the ingest loop.
    void service();

    void stop();

    bool isAvailable() const;
    bool hasFailed() const;
    int reconnects() const;
    std::string recognizerName() const;

    /// Vendor event to normalized event. Returns false for events that do
    /// not map to a TranscriptEvent (Closed, Error, empty transcripts).
    static bool normalize(const RecognizerEvent& raw, TranscriptEvent& out);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::stt
