/**
 * InterruptionController.cpp - Barge-in handling
 */

#include "vsp/session/InterruptionController.hpp"

#include <iostream>

namespace vsp::session {

InterruptionController::InterruptionController(tts::SpeechSynthesisStream& synthesis,
                                               ClientEventBus& bus, bool enabled)
    : synthesis_(synthesis)
    , bus_(bus)
    , enabled_(enabled) {
}

TurnActions InterruptionController::handle(const TranscriptEvent& event, TurnCoordinator& coordinator,
                                           Clock::time_point now) {
    if (!enabled_ || !event.is_speech_start || coordinator.state() != TurnState::Speaking) {
        return {};
    }

    auto start = std::chrono::steady_clock::now();

    // Order matters: nothing of the old response may follow playback_stopped
    synthesis_.cancel();
    bus_.stopPlayback();

    last_latency_ = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    interruptions_++;

    std::cout << "[InterruptionController] Barge-in, playback stopped in "
              << last_latency_.count() / 1000.0 << "ms" << std::endl;

    return coordinator.onBargeIn(now);
}

} // namespace vsp::session
