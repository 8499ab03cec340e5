/**
 * ConversationSession.hpp - One duplex conversation, end to end
 *
 * Connects: client audio → AudioIngestGateway → TranscriptionStream
 *           → TurnCoordinator → QueryDispatcher → SpeechSynthesisStream
 *           → ClientEventBus
 *
 * Three loops per session:
 *   ingest       drains client audio into the recognizer (gateway thread)
 *   coordinator  owns the Session, consumes the inbox, runs the timers
 *   output       paces synthesized chunks out to the client
 * Collaborator callbacks never touch session state; they post into the
 * coordinator inbox.
 */

#pragma once

#include "vsp/audio/AudioIngestGateway.hpp"
#include "vsp/core/Config.hpp"
#include "vsp/core/Types.hpp"
#include "vsp/session/ClientEventBus.hpp"
#include "vsp/session/Providers.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vsp::session {

enum class EndReason {
    ClientStop,
    TransportClosed,
    TransportFailed,
    RecognizerFailed,
    SynthesizerFailed,
    IdleTimeout,
    Shutdown
};

const char* toString(EndReason reason);

struct SessionStats {
    uint64_t frames_received = 0;
    uint64_t frames_dropped_backpressure = 0;
    uint64_t frames_dropped_unavailable = 0;
    uint64_t dispatches = 0;
    uint64_t duplicates_suppressed = 0;
    uint64_t responses_completed = 0;
    uint64_t barge_ins = 0;
    uint64_t apologies = 0;
    uint64_t reconnects = 0;
};

class ConversationSession {
public:
    using EndedCallback = std::function<void(const std::string& session_id, EndReason reason)>;

    /// Throws core::ConfigError when the configured vendors are unknown.
    ConversationSession(std::string session_id,
                        std::optional<std::string> user_id,
                        const core::PipelineConfig& config,
                        const Providers& providers,
                        std::shared_ptr<ClientSink> sink);
    ~ConversationSession();

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    /// Called (from the coordinator thread) when the session ends itself.
    void setEndedCallback(EndedCallback callback);

    bool start();

    /// Transport thread entry points.
    audio::IngestStatus onAudio(std::vector<uint8_t> frame);
    void onControl(const std::string& message);

    /// Asks the coordinator to end the session; `message` becomes an error
    /// frame when non-empty.
    void end(EndReason reason, const std::string& message = "");

    /// Stops every loop and releases upstream handles. Idempotent.
    void shutdown();

    const std::string& id() const;
    TurnState state() const;
    SessionStats stats() const;
    bool hasEnded() const;
    std::chrono::steady_clock::time_point lastAudioAt() const;
    const std::string& lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::session
