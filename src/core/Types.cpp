/**
 * Types.cpp - String forms used in client frames and logs
 */

#include "vsp/core/Types.hpp"

namespace vsp {

const char* toString(TurnState state) {
    switch (state) {
        case TurnState::Idle:        return "idle";
        case TurnState::Listening:   return "listening";
        case TurnState::Dispatching: return "dispatching";
        case TurnState::Speaking:    return "speaking";
    }
    return "unknown";
}

const char* toString(ConversationEntry::Role role) {
    return role == ConversationEntry::Role::User ? "user" : "assistant";
}

} // namespace vsp
