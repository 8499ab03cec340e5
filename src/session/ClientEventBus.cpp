/**
 * ClientEventBus.cpp - Outbound frame serialization
 */

#include "vsp/session/ClientEventBus.hpp"
#include "vsp/core/TextUtils.hpp"

#include <iostream>

using json = nlohmann::json;

namespace vsp::session {

ClientEventBus::ClientEventBus(std::shared_ptr<ClientSink> sink)
    : sink_(std::move(sink)) {
}

bool ClientEventBus::sendLocked(const json& frame) {
    if (closed_ || failed_) return false;

    if (sink_->sendText(frame.dump())) return true;

    std::cerr << "[ClientEventBus] Transport failed sending " << frame.value("type", "?") << std::endl;
    failed_ = true;
    active_response_ = 0;
    return false;
}

bool ClientEventBus::send(const json& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sendLocked(frame);
}

bool ClientEventBus::sendSessionStarted(const std::string& session_id) {
    return send({{"type", "session_started"}, {"session_id", session_id}});
}

bool ClientEventBus::sendPong() {
    return send({{"type", "pong"}});
}

bool ClientEventBus::sendTranscript(const std::string& text, bool is_final) {
    return send({{"type", "transcript"}, {"text", text}, {"is_final", is_final}});
}

bool ClientEventBus::sendStatus(TurnState state) {
    return send({{"type", "status"}, {"state", toString(state)}});
}

bool ClientEventBus::sendAssistantResponse(const std::string& text) {
    return send({{"type", "assistant_response"}, {"text", text}});
}

bool ClientEventBus::sendStructured(const json& data) {
    return send({{"type", "structured"}, {"data", data}});
}

bool ClientEventBus::sendBackpressure(size_t dropped) {
    return send({{"type", "backpressure"}, {"dropped", dropped}});
}

bool ClientEventBus::sendError(const std::string& message) {
    return send({{"type", "error"}, {"message", message}});
}

void ClientEventBus::beginResponse(uint64_t response_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_response_ = response_id;
}

bool ClientEventBus::sendAudioChunk(const SynthesisChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_response_ == 0 || chunk.response_id != active_response_) {
        return false;
    }

    return sendLocked({
        {"type", "audio_chunk"},
        {"sequence", chunk.sequence},
        {"payload", core::base64Encode(chunk.payload.data(), chunk.payload.size())},
        {"is_last", chunk.is_last}
    });
}

void ClientEventBus::endResponse(uint64_t response_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_response_ == response_id) {
        active_response_ = 0;
    }
}

bool ClientEventBus::stopPlayback() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_response_ = 0;
    return sendLocked({{"type", "playback_stopped"}});
}

bool ClientEventBus::isResponseActive(uint64_t response_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_id != 0 && active_response_ == response_id;
}

bool ClientEventBus::transportFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void ClientEventBus::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
    active_response_ = 0;
    sink_->close();
}

} // namespace vsp::session
