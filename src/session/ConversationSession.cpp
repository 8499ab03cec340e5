/**
 * ConversationSession.cpp - Per-connection pipeline and its three loops
 */

#include "vsp/session/ConversationSession.hpp"
#include "vsp/core/Channel.hpp"
#include "vsp/query/QueryDispatcher.hpp"
#include "vsp/session/InterruptionController.hpp"
#include "vsp/session/TurnCoordinator.hpp"
#include "vsp/stt/TranscriptionStream.hpp"
#include "vsp/tts/SpeechSynthesisStream.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vsp::session {

const char* toString(EndReason reason) {
    switch (reason) {
        case EndReason::ClientStop: return "client_stop";
        case EndReason::TransportClosed: return "transport_closed";
        case EndReason::TransportFailed: return "transport_failed";
        case EndReason::RecognizerFailed: return "recognizer_failed";
        case EndReason::SynthesizerFailed: return "synthesizer_failed";
        case EndReason::IdleTimeout: return "idle_timeout";
        case EndReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

namespace {

struct CoordinatorMessage {
    enum class Type {
        Transcript,
        QueryResult,
        SynthesisFinished,
        SynthesisFailed,
        RecognizerFailed,
        End
    };

    Type type = Type::Transcript;
    TranscriptEvent transcript;
    std::string dispatch_id;
    QueryResult result;
    uint64_t response_id = 0;
    EndReason reason = EndReason::Shutdown;
    std::string message;
};

Session makeSession(const std::string& session_id, const std::optional<std::string>& user_id) {
    Session session;
    session.session_id = session_id;
    session.user_id = user_id;
    return session;
}

int64_t nowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now().time_since_epoch()).count();
}

} // anonymous namespace

struct ConversationSession::Impl {
    std::string session_id;
    core::PipelineConfig config;

    ClientEventBus bus;
    TurnCoordinator coordinator;   // coordinator thread only
    core::Channel<CoordinatorMessage> inbox;

    std::unique_ptr<stt::TranscriptionStream> transcription;
    std::unique_ptr<tts::SpeechSynthesisStream> synthesis;
    std::unique_ptr<query::QueryDispatcher> dispatcher;
    std::unique_ptr<audio::AudioIngestGateway> gateway;
    std::unique_ptr<InterruptionController> interruption;

    std::atomic<TurnState> state{TurnState::Idle};
    std::atomic<bool> running{false};
    std::atomic<bool> ended{false};
    std::atomic<int64_t> last_audio_ns{0};

    std::thread coordinator_thread;
    std::thread output_thread;
    std::mutex shutdown_mutex;
    bool stopped = false;

    std::mutex callback_mutex;
    EndedCallback on_ended;

    std::atomic<uint64_t> dispatches{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> apologies{0};

    // Turn latency: dispatch → first audio chunk of the reply
    std::optional<Clock::time_point> last_dispatch_at;   // coordinator thread only
    std::mutex latency_mutex;
    uint64_t latency_response_id = 0;
    Clock::time_point latency_origin;

    std::string last_error;

    Impl(std::string id, const std::optional<std::string>& user_id, const core::PipelineConfig& cfg,
         const Providers& providers, std::shared_ptr<ClientSink> sink)
        : session_id(std::move(id))
        , config(cfg)
        , bus(std::move(sink))
        , coordinator(makeSession(session_id, user_id), cfg.turn)
        , inbox(static_cast<size_t>(cfg.session.inbox_capacity), core::OverflowPolicy::Block) {
        // The recognizer hears exactly what the client sends
        core::RecognizerConfig recognizer_config = config.recognizer;
        recognizer_config.format = config.ingest.format;

        transcription = std::make_unique<stt::TranscriptionStream>(
            providers.makeRecognizer(config), recognizer_config);
        synthesis = std::make_unique<tts::SpeechSynthesisStream>(
            providers.makeSynthesizer(config), config.synthesis);
        dispatcher = std::make_unique<query::QueryDispatcher>(providers.makeQueryClient(config));
        gateway = std::make_unique<audio::AudioIngestGateway>(*transcription, config.ingest);
        interruption = std::make_unique<InterruptionController>(
            *synthesis, bus, config.session.allow_interruption);

        last_audio_ns = nowNs();
    }

    void post(CoordinatorMessage message) {
        inbox.push(std::move(message));
    }

    // ---- coordinator loop ----

    void apply(const TurnActions& actions) {
        for (const auto& action : actions) {
            switch (action.kind) {
                case TurnAction::Kind::StateChanged:
                    state = action.state;
                    bus.sendStatus(action.state);
                    break;

                case TurnAction::Kind::Dispatch:
                    dispatches++;
                    last_dispatch_at = Clock::now();
                    dispatcher->dispatch(action.utterance, action.context);
                    break;

                case TurnAction::Kind::Speak:
                    if (action.apology) apologies++;
                    if (last_dispatch_at) {
                        std::lock_guard<std::mutex> lock(latency_mutex);
                        latency_response_id = action.response_id;
                        latency_origin = *last_dispatch_at;
                    }
                    last_dispatch_at.reset();

                    std::cout << "[ConversationSession] Assistant: " << action.text << std::endl;
                    bus.beginResponse(action.response_id);
                    bus.sendAssistantResponse(action.text);
                    if (!action.structured.is_null()) {
                        bus.sendStructured(action.structured);
                    }
                    synthesis->synthesize(action.response_id, action.text);
                    break;

                case TurnAction::Kind::DuplicateSuppressed:
                    duplicates++;
                    break;

                case TurnAction::Kind::DispatchAbandoned:
                    dispatcher->abandon(action.utterance.dispatch_id);
                    break;
            }
        }
    }

    void finish(EndReason reason, const std::string& message) {
        if (ended.exchange(true)) return;

        if (!message.empty()) {
            bus.sendError(message);
        }
        std::cout << "[ConversationSession] " << session_id << " ending (" << toString(reason) << ")"
                  << std::endl;

        synthesis->cancel();
        bus.close();

        EndedCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            callback = on_ended;
        }
        if (callback) callback(session_id, reason);
    }

    /// Returns false once the message ended the session.
    bool handle(const CoordinatorMessage& message, Clock::time_point now) {
        switch (message.type) {
            case CoordinatorMessage::Type::Transcript: {
                const TranscriptEvent& event = message.transcript;
                if (!event.text.empty()) {
                    bus.sendTranscript(event.text, event.is_final);
                }
                apply(interruption->handle(event, coordinator, now));
                apply(coordinator.onTranscript(event, now));
                return true;
            }

            case CoordinatorMessage::Type::QueryResult:
                apply(coordinator.onQueryResult(message.dispatch_id, message.result, now));
                return true;

            case CoordinatorMessage::Type::SynthesisFinished:
                if (message.response_id == coordinator.speakingResponseId()) {
                    completed++;
                }
                bus.endResponse(message.response_id);
                apply(coordinator.onSynthesisComplete(message.response_id, now));
                return true;

            case CoordinatorMessage::Type::SynthesisFailed:
                if (message.response_id != coordinator.speakingResponseId()) return true;
                finish(EndReason::SynthesizerFailed, "speech synthesis unavailable");
                return false;

            case CoordinatorMessage::Type::RecognizerFailed:
                finish(EndReason::RecognizerFailed, "speech recognition unavailable");
                return false;

            case CoordinatorMessage::Type::End:
                finish(message.reason, message.message);
                return false;
        }
        return true;
    }

    void coordinatorLoop() {
        const auto tick = std::chrono::milliseconds(config.session.coordinator_tick_ms);

        if (!config.session.greeting.empty()) {
            apply(coordinator.speak(config.session.greeting, Clock::now()));
        }

        while (running) {
            auto message = inbox.popFor(tick);
            auto now = Clock::now();

            if (bus.transportFailed()) {
                finish(EndReason::TransportFailed, "");
                break;
            }
            if (message && !handle(*message, now)) {
                break;
            }
            apply(coordinator.onTick(now));
        }
    }

    // ---- output loop ----

    /// Sleeps until `deadline` unless the response is retired first.
    bool waitUntil(Clock::time_point deadline, uint64_t response_id) {
        while (running && bus.isResponseActive(response_id)) {
            auto now = Clock::now();
            if (now >= deadline) return true;
            auto slice = std::min<Clock::duration>(deadline - now, std::chrono::milliseconds(20));
            std::this_thread::sleep_for(slice);
        }
        return false;
    }

    void logLatency(uint64_t response_id) {
        std::lock_guard<std::mutex> lock(latency_mutex);
        if (latency_response_id != response_id) return;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - latency_origin);
        std::cout << "[ConversationSession] Turn latency: " << elapsed.count()
                  << "ms (utterance end to first audio)" << std::endl;
        latency_response_id = 0;
    }

    void outputLoop() {
        const AudioFormat format = synthesis->format();
        const auto client_buffer = std::chrono::milliseconds(config.synthesis.client_buffer_ms);

        uint64_t paced_response = 0;
        Clock::time_point started;
        std::chrono::milliseconds sent{0};

        while (running) {
            auto chunk = synthesis->next(std::chrono::milliseconds(50));
            if (!chunk) continue;

            if (chunk->response_id != paced_response) {
                paced_response = chunk->response_id;
                started = Clock::now();
                sent = std::chrono::milliseconds(0);
            }

            // Keep the client at most client_buffer_ms ahead of real time
            if (!waitUntil(started + sent - client_buffer, chunk->response_id)) continue;

            if (chunk->sequence == 0) {
                logLatency(chunk->response_id);
            }
            if (!bus.sendAudioChunk(*chunk)) continue;
            sent += format.durationOf(chunk->payload.size());

            if (chunk->is_last) {
                // Speaking lasts until the client has played the last sample
                if (waitUntil(started + sent, chunk->response_id)) {
                    CoordinatorMessage finished;
                    finished.type = CoordinatorMessage::Type::SynthesisFinished;
                    finished.response_id = chunk->response_id;
                    post(std::move(finished));
                }
            }
        }
    }
};

ConversationSession::ConversationSession(std::string session_id,
                                         std::optional<std::string> user_id,
                                         const core::PipelineConfig& config,
                                         const Providers& providers,
                                         std::shared_ptr<ClientSink> sink)
    : impl_(std::make_unique<Impl>(std::move(session_id), user_id, config, providers, std::move(sink))) {
}

ConversationSession::~ConversationSession() {
    shutdown();
}

void ConversationSession::setEndedCallback(EndedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_ended = std::move(callback);
}

bool ConversationSession::start() {
    Impl* impl = impl_.get();

    impl->transcription->setEventSink([impl](const TranscriptEvent& event) {
        CoordinatorMessage message;
        message.type = CoordinatorMessage::Type::Transcript;
        message.transcript = event;
        impl->post(std::move(message));
    });
    impl->transcription->setFailureSink([impl](const std::string& reason) {
        CoordinatorMessage message;
        message.type = CoordinatorMessage::Type::RecognizerFailed;
        message.message = reason;
        impl->post(std::move(message));
    });
    impl->synthesis->setFailureCallback([impl](uint64_t response_id, const std::string& reason) {
        CoordinatorMessage message;
        message.type = CoordinatorMessage::Type::SynthesisFailed;
        message.response_id = response_id;
        message.message = reason;
        impl->post(std::move(message));
    });
    impl->dispatcher->setCompletionCallback([impl](const std::string& dispatch_id, const QueryResult& result) {
        CoordinatorMessage message;
        message.type = CoordinatorMessage::Type::QueryResult;
        message.dispatch_id = dispatch_id;
        message.result = result;
        impl->post(std::move(message));
    });
    impl->gateway->setBackpressureCallback([impl](size_t dropped) {
        impl->bus.sendBackpressure(dropped);
    });

    if (!impl->transcription->start()) {
        impl->last_error = "recognizer '" + impl->transcription->recognizerName() + "' failed to start";
        std::cerr << "[ConversationSession] " << impl->last_error << std::endl;
        return false;
    }
    if (!impl->synthesis->start()) {
        impl->last_error = "synthesizer failed to start";
        std::cerr << "[ConversationSession] " << impl->last_error << std::endl;
        impl->transcription->stop();
        return false;
    }

    impl->dispatcher->start();
    impl->gateway->start();
    impl->running = true;
    impl->bus.sendSessionStarted(impl->session_id);
    impl->bus.sendStatus(TurnState::Idle);

    impl->coordinator_thread = std::thread([impl]() { impl->coordinatorLoop(); });
    impl->output_thread = std::thread([impl]() { impl->outputLoop(); });

    std::cout << "[ConversationSession] " << impl->session_id << " started ("
              << impl->transcription->recognizerName() << " -> " << impl->config.synthesis.vendor << ")"
              << std::endl;
    return true;
}

audio::IngestStatus ConversationSession::onAudio(std::vector<uint8_t> frame) {
    impl_->last_audio_ns = nowNs();
    if (impl_->ended) {
        return audio::IngestStatus::Closed;
    }
    return impl_->gateway->ingest(std::move(frame));
}

void ConversationSession::onControl(const std::string& message) {
    try {
        json doc = json::parse(message);
        std::string type = doc.value("type", "");
        if (type == "stop") {
            end(EndReason::ClientStop);
        } else if (type == "ping") {
            impl_->bus.sendPong();
        } else {
            std::cerr << "[ConversationSession] Ignoring control frame of type '" << type << "'" << std::endl;
        }
    } catch (const json::exception& e) {
        std::cerr << "[ConversationSession] Malformed control frame: " << e.what() << std::endl;
    }
}

void ConversationSession::end(EndReason reason, const std::string& message) {
    if (impl_->ended) return;

    CoordinatorMessage end_message;
    end_message.type = CoordinatorMessage::Type::End;
    end_message.reason = reason;
    end_message.message = message;
    impl_->post(std::move(end_message));
}

void ConversationSession::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->shutdown_mutex);
    if (impl_->stopped) return;
    impl_->stopped = true;

    impl_->running = false;
    impl_->inbox.close();
    if (impl_->coordinator_thread.joinable()) {
        impl_->coordinator_thread.join();
    }

    impl_->gateway->stop();
    impl_->transcription->stop();
    impl_->synthesis->shutdown();
    impl_->dispatcher->shutdown();

    if (impl_->output_thread.joinable()) {
        impl_->output_thread.join();
    }

    impl_->ended = true;
    impl_->bus.close();

    SessionStats s = stats();
    std::cout << "[ConversationSession] " << impl_->session_id << " closed: "
              << s.frames_received << " frames, "
              << s.frames_dropped_backpressure << " dropped (backpressure), "
              << s.frames_dropped_unavailable << " dropped (recognizer unavailable), "
              << s.dispatches << " dispatches, "
              << s.duplicates_suppressed << " duplicates, "
              << s.barge_ins << " barge-ins, "
              << s.apologies << " apologies, "
              << s.reconnects << " reconnects" << std::endl;
}

const std::string& ConversationSession::id() const {
    return impl_->session_id;
}

TurnState ConversationSession::state() const {
    return impl_->state.load();
}

SessionStats ConversationSession::stats() const {
    SessionStats s;
    audio::IngestCounters counters = impl_->gateway->counters();
    s.frames_received = counters.received;
    s.frames_dropped_backpressure = counters.dropped_backpressure;
    s.frames_dropped_unavailable = counters.dropped_unavailable;
    s.dispatches = impl_->dispatches;
    s.duplicates_suppressed = impl_->duplicates;
    s.responses_completed = impl_->completed;
    s.barge_ins = impl_->interruption->interruptions();
    s.apologies = impl_->apologies;
    s.reconnects = static_cast<uint64_t>(impl_->transcription->reconnects());
    return s;
}

bool ConversationSession::hasEnded() const {
    return impl_->ended.load();
}

std::chrono::steady_clock::time_point ConversationSession::lastAudioAt() const {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(impl_->last_audio_ns.load())));
}

const std::string& ConversationSession::lastError() const {
    return impl_->last_error;
}

} // namespace vsp::session
