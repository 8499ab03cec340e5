/**
 * SessionManager.hpp - Owns every live ConversationSession
 *
 * The transport layer talks to sessions only through here. A housekeeping
 * thread reaps sessions that ended themselves (client stop, provider
 * failure) and times out sessions that stopped sending audio.
 */

#pragma once

#include "vsp/audio/AudioIngestGateway.hpp"
#include "vsp/core/Config.hpp"
#include "vsp/core/Types.hpp"
#include "vsp/session/ClientEventBus.hpp"
#include "vsp/session/ConversationSession.hpp"
#include "vsp/session/Providers.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vsp {

class SessionManager {
public:
    explicit SessionManager(core::PipelineConfig config,
                            session::Providers providers = session::Providers::defaults());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Creates and starts a session for a new client connection. On failure
    /// the client gets an error frame, the sink is closed and nullopt is
    /// returned.
    std::optional<std::string> open(std::shared_ptr<session::ClientSink> sink,
                                    std::optional<std::string> user_id = std::nullopt);

    audio::IngestStatus onAudio(const std::string& session_id, std::vector<uint8_t> frame);
    void onControl(const std::string& session_id, const std::string& message);

    /// Transport disconnected. Tears the session down immediately.
    void close(const std::string& session_id);

    size_t activeSessions() const;
    std::optional<session::SessionStats> stats(const std::string& session_id) const;
    std::optional<TurnState> state(const std::string& session_id) const;

    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp
