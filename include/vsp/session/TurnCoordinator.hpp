/**
 * TurnCoordinator.hpp - Turn-taking state machine
 *
 * Pure logic: every input carries the current time and every output is a
 * TurnAction for the owning session to carry out. It owns the Session and
 * is driven from a single thread (the session's coordinator loop).
 *
 *   Idle ──text──► Listening ──trigger──► Dispatching ──result──► Speaking
 *                      ▲                      │ error/timeout (apology)│
 *                      └────── done / barge-in ◄──────────────────────┘
 *
 * Triggers (Listening only): provider endpoint, silence window with final
 * text committed, or a final ending in terminal punctuation. Each utterance
 * is dispatched at most once, whichever trigger fires first. Interim
 * hypotheses are never dispatched; an endpoint that arrives while only an
 * interim is open waits for the final that commits it.
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/core/Session.hpp"
#include "vsp/core/Types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vsp::session {

using Clock = std::chrono::steady_clock;

struct TurnAction {
    enum class Kind {
        StateChanged,
        Dispatch,
        Speak,
        DuplicateSuppressed,
        DispatchAbandoned
    };

    Kind kind = Kind::StateChanged;
    TurnState state = TurnState::Idle;   // StateChanged
    Utterance utterance;                 // Dispatch (dispatch_id for DispatchAbandoned)
    SessionContext context;              // Dispatch
    std::string text;                    // Speak, DuplicateSuppressed
    uint64_t response_id = 0;            // Speak
    bool apology = false;                // Speak
    nlohmann::json structured;           // Speak, null when absent
};

using TurnActions = std::vector<TurnAction>;

class TurnCoordinator {
public:
    TurnCoordinator(Session session, const core::TurnConfig& config);

    TurnActions onTranscript(const TranscriptEvent& event, Clock::time_point now);
    TurnActions onTick(Clock::time_point now);
    TurnActions onQueryResult(const std::string& dispatch_id, const QueryResult& result,
                              Clock::time_point now);
    TurnActions onSynthesisComplete(uint64_t response_id, Clock::time_point now);

    /// Speaking → Listening after the caller has stopped playback.
    TurnActions onBargeIn(Clock::time_point now);

    /// Speaks unprompted text (greeting). Ignored unless Idle or Listening.
    TurnActions speak(const std::string& text, Clock::time_point now);

    TurnState state() const { return session_.turn_state; }
    const Session& session() const { return session_; }
    uint64_t speakingResponseId() const { return speaking_response_id_; }

    /// Confident finals committed since the last dispatch.
    std::string accumulatedText() const;

private:
    void transition(TurnState next, TurnActions& actions);
    void evaluate(bool trigger, Clock::time_point now, TurnActions& actions);
    void dispatch(Clock::time_point now, TurnActions& actions);
    bool suppressIfDuplicate(Clock::time_point now, TurnActions& actions);
    void beginSpeaking(const std::string& text, bool apology, const nlohmann::json& structured,
                       TurnActions& actions);
    void finishSpeaking(Clock::time_point now, TurnActions& actions);
    void appendHistory(ConversationEntry::Role role, const std::string& text);
    void clearAccumulated();
    bool dedupWindowOpen(Clock::time_point now) const;
    SessionContext context() const;

    core::TurnConfig config_;
    Session session_;

    std::string interim_;
    Clock::time_point last_activity_{};
    bool endpoint_pending_ = false;
    std::optional<Clock::time_point> dispatch_deadline_;
    std::optional<Clock::time_point> last_completed_at_;
    uint64_t next_sequence_ = 1;
    uint64_t next_response_id_ = 1;
    uint64_t speaking_response_id_ = 0;
};

} // namespace vsp::session
