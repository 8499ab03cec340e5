/**
 * TurnCoordinator.cpp - Turn-taking state machine
 */

#include "vsp/session/TurnCoordinator.hpp"
#include "vsp/core/TextUtils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace vsp::session {

namespace {

std::string makeDispatchId(uint64_t key, uint64_t sequence) {
    std::ostringstream id;
    id << std::hex << std::setw(16) << std::setfill('0') << key << "-" << std::dec << sequence;
    return id.str();
}

} // anonymous namespace

TurnCoordinator::TurnCoordinator(Session session, const core::TurnConfig& config)
    : config_(config)
    , session_(std::move(session)) {
}

std::string TurnCoordinator::accumulatedText() const {
    return session_.pending_utterance_buffer;
}

TurnActions TurnCoordinator::onTranscript(const TranscriptEvent& event, Clock::time_point now) {
    TurnActions actions;

    if (event.is_speech_start) {
        last_activity_ = now;
    }

    std::string text = core::trim(event.text);

    if (event.is_final && !text.empty() && event.confidence < config_.min_confidence) {
        std::cout << "[TurnCoordinator] Ignoring low-confidence final (" << event.confidence
                  << "): \"" << text << "\"" << std::endl;
        interim_.clear();
        if (session_.pending_utterance_buffer.empty()) endpoint_pending_ = false;
        return actions;
    }

    if (!text.empty()) {
        if (event.is_final) {
            session_.pending_utterance_buffer =
                core::joinFragments(session_.pending_utterance_buffer, text);
            interim_.clear();
        } else {
            interim_ = text;
        }
        last_activity_ = now;

        if (session_.turn_state == TurnState::Idle) {
            transition(TurnState::Listening, actions);
        }
    } else if (event.is_final) {
        interim_.clear();
    }

    // An endpoint seen while only an interim was open fires on the final
    // that commits it.
    bool awaited_final = event.is_final && !text.empty() && endpoint_pending_ &&
                         session_.turn_state == TurnState::Listening;
    if (event.is_endpoint && session_.pending_utterance_buffer.empty() && !interim_.empty()) {
        endpoint_pending_ = true;
        return actions;
    }

    bool trigger = event.is_endpoint || awaited_final ||
                   (event.is_final && core::endsWithTerminalPunctuation(text));
    evaluate(trigger, now, actions);
    return actions;
}

TurnActions TurnCoordinator::onTick(Clock::time_point now) {
    TurnActions actions;

    if (session_.turn_state == TurnState::Dispatching && dispatch_deadline_ &&
        now >= *dispatch_deadline_) {
        std::cerr << "[TurnCoordinator] Dispatch " << session_.active_request_id
                  << " timed out after " << config_.dispatch_timeout_ms << "ms" << std::endl;
        TurnAction abandoned;
        abandoned.kind = TurnAction::Kind::DispatchAbandoned;
        abandoned.utterance.dispatch_id = session_.active_request_id;
        actions.push_back(std::move(abandoned));

        dispatch_deadline_.reset();
        session_.active_request_id.clear();
        beginSpeaking(config_.apology_text, true, nullptr, actions);
        return actions;
    }

    // An open interim may still be revised into the final; give it a
    // second window before dispatching only what was committed.
    auto window = std::chrono::milliseconds(config_.silence_window_ms);
    if (!interim_.empty()) window *= 2;

    if (session_.turn_state == TurnState::Listening && !accumulatedText().empty() &&
        now - last_activity_ >= window) {
        evaluate(true, now, actions);
    }
    return actions;
}

TurnActions TurnCoordinator::onQueryResult(const std::string& dispatch_id, const QueryResult& result,
                                           Clock::time_point /*now*/) {
    TurnActions actions;

    if (session_.turn_state != TurnState::Dispatching || dispatch_id != session_.active_request_id) {
        std::cout << "[TurnCoordinator] Ignoring stale result for " << dispatch_id << std::endl;
        return actions;
    }

    dispatch_deadline_.reset();
    session_.active_request_id.clear();

    if (!result.ok()) {
        std::cerr << "[TurnCoordinator] Dispatch " << dispatch_id << " failed: "
                  << *result.error << std::endl;
        beginSpeaking(config_.apology_text, true, nullptr, actions);
    } else if (core::trim(result.reply_text).empty()) {
        std::cerr << "[TurnCoordinator] Dispatch " << dispatch_id << " returned an empty reply" << std::endl;
        beginSpeaking(config_.apology_text, true, nullptr, actions);
    } else {
        beginSpeaking(result.reply_text, false, result.structured_payload, actions);
    }
    return actions;
}

TurnActions TurnCoordinator::onSynthesisComplete(uint64_t response_id, Clock::time_point now) {
    TurnActions actions;
    if (session_.turn_state != TurnState::Speaking || response_id != speaking_response_id_) {
        return actions;
    }

    last_completed_at_ = now;
    finishSpeaking(now, actions);
    return actions;
}

TurnActions TurnCoordinator::onBargeIn(Clock::time_point now) {
    TurnActions actions;
    if (session_.turn_state != TurnState::Speaking) return actions;

    std::cout << "[TurnCoordinator] Barge-in, dropping response " << speaking_response_id_ << std::endl;
    // A new request right after an interruption is deliberate, not an echo
    last_completed_at_.reset();
    last_activity_ = now;
    finishSpeaking(now, actions);
    return actions;
}

TurnActions TurnCoordinator::speak(const std::string& text, Clock::time_point /*now*/) {
    TurnActions actions;
    if (core::trim(text).empty()) return actions;
    if (session_.turn_state == TurnState::Dispatching || session_.turn_state == TurnState::Speaking) {
        return actions;
    }

    beginSpeaking(text, false, nullptr, actions);
    return actions;
}

void TurnCoordinator::transition(TurnState next, TurnActions& actions) {
    if (session_.turn_state == next) return;

    std::cout << "[TurnCoordinator] " << toString(session_.turn_state) << " -> " << toString(next)
              << std::endl;
    session_.turn_state = next;

    TurnAction action;
    action.kind = TurnAction::Kind::StateChanged;
    action.state = next;
    actions.push_back(std::move(action));
}

void TurnCoordinator::evaluate(bool trigger, Clock::time_point now, TurnActions& actions) {
    if (!trigger) return;

    if (accumulatedText().empty()) {
        endpoint_pending_ = false;
        return;
    }

    switch (session_.turn_state) {
        case TurnState::Listening:
            dispatch(now, actions);
            break;
        case TurnState::Dispatching:
        case TurnState::Speaking:
            // Held until we are back in Listening
            if (!suppressIfDuplicate(now, actions)) {
                endpoint_pending_ = true;
            }
            break;
        case TurnState::Idle:
            break;
    }
}

bool TurnCoordinator::dedupWindowOpen(Clock::time_point now) const {
    return last_completed_at_ &&
           now - *last_completed_at_ < std::chrono::milliseconds(config_.dedup_window_ms);
}

bool TurnCoordinator::suppressIfDuplicate(Clock::time_point now, TurnActions& actions) {
    std::string text = core::trim(accumulatedText());
    std::string normalized = core::normalizeUtterance(text);
    if (normalized.empty()) {
        clearAccumulated();
        return true;
    }

    uint64_t key = core::hashText(normalized);
    bool outstanding = session_.turn_state == TurnState::Dispatching ||
                       session_.turn_state == TurnState::Speaking;
    if (session_.last_dispatched_hash == 0 || key != session_.last_dispatched_hash ||
        !(outstanding || dedupWindowOpen(now))) {
        return false;
    }

    std::cout << "[TurnCoordinator] Suppressing duplicate: \"" << text << "\"" << std::endl;
    clearAccumulated();

    TurnAction action;
    action.kind = TurnAction::Kind::DuplicateSuppressed;
    action.text = text;
    actions.push_back(std::move(action));
    return true;
}

void TurnCoordinator::dispatch(Clock::time_point now, TurnActions& actions) {
    if (suppressIfDuplicate(now, actions)) return;

    std::string text = core::trim(accumulatedText());
    clearAccumulated();

    Utterance utterance;
    utterance.text = text;
    utterance.dedup_key = core::hashText(core::normalizeUtterance(text));
    utterance.sequence = next_sequence_++;
    utterance.dispatch_id = makeDispatchId(utterance.dedup_key, utterance.sequence);

    SessionContext ctx = context();

    session_.last_dispatched_hash = utterance.dedup_key;
    session_.active_request_id = utterance.dispatch_id;
    appendHistory(ConversationEntry::Role::User, text);
    dispatch_deadline_ = now + std::chrono::milliseconds(config_.dispatch_timeout_ms);
    last_completed_at_.reset();

    std::cout << "[TurnCoordinator] Dispatching " << utterance.dispatch_id << ": \"" << text << "\""
              << std::endl;
    transition(TurnState::Dispatching, actions);

    TurnAction action;
    action.kind = TurnAction::Kind::Dispatch;
    action.utterance = std::move(utterance);
    action.context = std::move(ctx);
    actions.push_back(std::move(action));
}

void TurnCoordinator::beginSpeaking(const std::string& text, bool apology,
                                    const nlohmann::json& structured, TurnActions& actions) {
    uint64_t response_id = next_response_id_++;
    speaking_response_id_ = response_id;
    appendHistory(ConversationEntry::Role::Assistant, text);
    transition(TurnState::Speaking, actions);

    TurnAction action;
    action.kind = TurnAction::Kind::Speak;
    action.text = text;
    action.response_id = response_id;
    action.apology = apology;
    action.structured = structured;
    actions.push_back(std::move(action));
}

void TurnCoordinator::finishSpeaking(Clock::time_point now, TurnActions& actions) {
    speaking_response_id_ = 0;
    transition(TurnState::Listening, actions);

    if (endpoint_pending_) {
        evaluate(true, now, actions);
    }
}

void TurnCoordinator::appendHistory(ConversationEntry::Role role, const std::string& text) {
    ConversationEntry entry;
    entry.role = role;
    entry.text = text;
    entry.timestamp = std::chrono::system_clock::now();
    session_.conversation_history.push_back(std::move(entry));

    while (session_.conversation_history.size() > config_.history_limit) {
        session_.conversation_history.erase(session_.conversation_history.begin());
    }
}

void TurnCoordinator::clearAccumulated() {
    session_.pending_utterance_buffer.clear();
    interim_.clear();
    endpoint_pending_ = false;
}

SessionContext TurnCoordinator::context() const {
    SessionContext ctx;
    ctx.session_id = session_.session_id;
    ctx.user_id = session_.user_id;
    ctx.history = session_.conversation_history;
    return ctx;
}

} // namespace vsp::session
