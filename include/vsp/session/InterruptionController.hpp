/**
 * InterruptionController.hpp - Barge-in handling
 *
 * Runs on the coordinator loop. When the user starts speaking over a
 * reply it cancels synthesis, drops whatever was still queued for the
 * client, emits playback_stopped and hands the turn back to Listening.
 */

#pragma once

#include "vsp/session/ClientEventBus.hpp"
#include "vsp/session/TurnCoordinator.hpp"
#include "vsp/tts/SpeechSynthesisStream.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace vsp::session {

class InterruptionController {
public:
    InterruptionController(tts::SpeechSynthesisStream& synthesis, ClientEventBus& bus, bool enabled);

    /// Returns the coordinator's actions when `event` interrupted playback,
    /// nothing otherwise.
    TurnActions handle(const TranscriptEvent& event, TurnCoordinator& coordinator, Clock::time_point now);

    uint64_t interruptions() const { return interruptions_.load(); }
    std::chrono::microseconds lastCancelLatency() const { return last_latency_; }

private:
    tts::SpeechSynthesisStream& synthesis_;
    ClientEventBus& bus_;
    bool enabled_;
    std::atomic<uint64_t> interruptions_{0};
    std::chrono::microseconds last_latency_{0};
};

} // namespace vsp::session
