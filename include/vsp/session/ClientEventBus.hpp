/**
 * ClientEventBus.hpp - Serialized JSON frames toward one client
 *
 * All outbound frames of a session pass through here, under one lock, so
 * frames from the coordinator and the synthesis output loop never
 * interleave. Audio chunks are only sent for the active response:
 * stopPlayback() retires it before emitting playback_stopped, which makes
 * playback_stopped the last word on that response.
 */

#pragma once

#include "vsp/core/Types.hpp"

#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace vsp::session {

/// Transport endpoint of one client connection.
class ClientSink {
public:
    virtual ~ClientSink() = default;

    /// Returns false when the transport is gone.
    virtual bool sendText(const std::string& frame) = 0;
    virtual void close() = 0;
};

class ClientEventBus {
public:
    explicit ClientEventBus(std::shared_ptr<ClientSink> sink);

    /// First frame of every session.
    bool sendSessionStarted(const std::string& session_id);
    bool sendPong();

    bool sendTranscript(const std::string& text, bool is_final);
    bool sendStatus(TurnState state);
    bool sendAssistantResponse(const std::string& text);
    bool sendStructured(const nlohmann::json& data);
    bool sendBackpressure(size_t dropped);
    bool sendError(const std::string& message);

    void beginResponse(uint64_t response_id);

    /// Returns false when the chunk was dropped (response no longer active)
    /// or the transport failed.
    bool sendAudioChunk(const SynthesisChunk& chunk);

    /// Retires the response once its last chunk went out.
    void endResponse(uint64_t response_id);

    /// Retires the active response and emits playback_stopped.
    bool stopPlayback();

    bool isResponseActive(uint64_t response_id) const;

    /// Set once the sink refused a frame. Nothing is sent afterwards.
    bool transportFailed() const;

    /// Closes the sink. No frame is sent afterwards.
    void close();

private:
    bool send(const nlohmann::json& frame);
    bool sendLocked(const nlohmann::json& frame);

    std::shared_ptr<ClientSink> sink_;
    mutable std::mutex mutex_;
    uint64_t active_response_ = 0;
    bool failed_ = false;
    bool closed_ = false;
};

} // namespace vsp::session
