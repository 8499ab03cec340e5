/**
 * Session.hpp - Per-conversation state
 *
 * Owned by the session's coordinator task. Nothing outside that task
 * mutates it; other loops talk to the coordinator through its inbox.
 */

#pragma once

#include "vsp/core/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vsp {

struct Session {
    std::string session_id;
    std::optional<std::string> user_id;
    TurnState turn_state = TurnState::Idle;
    std::vector<ConversationEntry> conversation_history;
    std::string pending_utterance_buffer;
    uint64_t last_dispatched_hash = 0;
    std::string active_request_id;
};

} // namespace vsp
