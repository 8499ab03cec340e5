/**
 * test_session_manager.cpp - End-to-end session tests with scripted providers
 */

#include "vsp/SessionManager.hpp"
#include "support/FakeProviders.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace vsp;
using json = nlohmann::json;
using vsp::testing::FakeQueryClient;
using vsp::testing::FakeRecognizer;
using vsp::testing::FakeSynthesizer;
using vsp::testing::RecordingSink;
using vsp::testing::waitUntil;

namespace {

/// Registers the fakes under vendor "fake" and keeps handles to the
/// instances the session creates.
struct Harness {
    std::atomic<FakeRecognizer*> recognizer{nullptr};
    std::atomic<FakeSynthesizer*> synthesizer{nullptr};
    std::shared_ptr<FakeQueryClient> query = std::make_shared<FakeQueryClient>();

    int failing_recognizer_starts = 0;
    int failing_synth_calls = 0;
    int synth_audio_ms = 300;

    session::Providers providers() {
        session::Providers providers;
        providers.registerRecognizer("fake", [this](const core::PipelineConfig&) {
            auto fake = std::make_unique<FakeRecognizer>();
            fake->failing_starts = failing_recognizer_starts;
            recognizer = fake.get();
            return fake;
        });
        providers.registerSynthesizer("fake", [this](const core::PipelineConfig& config) {
            auto fake = std::make_unique<FakeSynthesizer>(config.synthesis.format);
            fake->audio_ms = synth_audio_ms;
            fake->failing_calls = failing_synth_calls;
            synthesizer = fake.get();
            return fake;
        });
        providers.setQueryClientFactory([this](const core::PipelineConfig&) {
            return query;
        });
        return providers;
    }
};

core::PipelineConfig testConfig() {
    core::PipelineConfig config;
    config.recognizer.vendor = "fake";
    config.synthesis.vendor = "fake";
    config.synthesis.format = AudioFormat{16000, 1};
    config.synthesis.client_buffer_ms = 100;
    config.ingest.poll_ms = 5;
    config.session.coordinator_tick_ms = 10;
    return config;
}

int indexOf(const std::vector<json>& frames, const std::string& type, int from = 0) {
    for (int i = from; i < static_cast<int>(frames.size()); ++i) {
        if (frames[i].value("type", "") == type) return i;
    }
    return -1;
}

bool isStatus(const json& frame, const std::string& state) {
    return frame.value("type", "") == "status" && frame.value("state", "") == state;
}

/// True once a status frame `state` follows the last audio chunk.
bool statusAfterLastChunk(const std::vector<json>& frames, const std::string& state) {
    int last = -1;
    for (int i = 0; i < static_cast<int>(frames.size()); ++i) {
        if (frames[i].value("type", "") == "audio_chunk" && frames[i].value("is_last", false)) last = i;
    }
    if (last < 0) return false;
    for (int i = last + 1; i < static_cast<int>(frames.size()); ++i) {
        if (isStatus(frames[i], state)) return true;
    }
    return false;
}

void say(FakeRecognizer* recognizer, const std::string& text) {
    recognizer->speechStarted();
    recognizer->transcript(text, true, true);
}

} // anonymous namespace

void test_full_turn() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();

    auto id = manager.open(sink, std::string("user-42"));
    assert(id.has_value());
    assert(id->rfind("sess-", 0) == 0);
    assert(manager.activeSessions() == 1);
    assert(sink->waitFor([](const std::vector<json>& f) { return f.size() >= 2 && isStatus(f[1], "idle"); }));
    auto opening = sink->frames();
    assert(opening[0]["type"] == "session_started");
    assert(opening[0]["session_id"] == *id);

    say(harness.recognizer, "find organic milk");

    assert(sink->waitFor([](const std::vector<json>& f) { return statusAfterLastChunk(f, "listening"); }));
    auto frames = sink->frames();

    int transcript = indexOf(frames, "transcript");
    int response = indexOf(frames, "assistant_response");
    int structured = indexOf(frames, "structured");
    int first_audio = indexOf(frames, "audio_chunk");
    assert(transcript >= 0 && frames[transcript]["text"] == "find organic milk");
    assert(frames[transcript]["is_final"] == true);
    assert(response > transcript);
    assert(frames[response]["text"] == "I found 3 options for organic milk.");
    assert(structured > response);
    assert(frames[structured]["data"]["products"].size() == 3);
    assert(first_audio > response);

    // listening -> dispatching -> speaking, in that order
    std::vector<std::string> states;
    for (const auto& frame : frames) {
        if (frame.value("type", "") == "status") states.push_back(frame["state"]);
    }
    assert((states == std::vector<std::string>{"idle", "listening", "dispatching", "speaking", "listening"}));

    // Consecutive sequences and exactly one is_last, on the final chunk
    auto audio = sink->framesOfType("audio_chunk");
    size_t lasts = 0;
    for (size_t i = 0; i < audio.size(); ++i) {
        assert(audio[i]["sequence"] == i);
        if (audio[i]["is_last"] == true) lasts++;
    }
    assert(lasts == 1);
    assert(audio.back()["is_last"] == true);

    auto utterances = harness.query->utterances();
    assert(utterances.size() == 1);
    assert(utterances[0].text == "find organic milk");
    auto contexts = harness.query->contexts();
    assert(contexts[0].session_id == *id);
    assert(contexts[0].user_id == std::optional<std::string>("user-42"));

    auto stats = manager.stats(*id);
    assert(stats && stats->dispatches == 1);
    assert(waitUntil([&]() { return manager.stats(*id)->responses_completed == 1; }));
    assert(manager.state(*id) == TurnState::Listening);

    manager.close(*id);
    assert(manager.activeSessions() == 0);
    assert(sink->closed());

    std::cout << "[PASS] test_full_turn (" << audio.size() << " chunks)" << std::endl;
}

void test_repeat_suppressed_after_reply() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(sink->waitFor([](const std::vector<json>& f) { return statusAfterLastChunk(f, "listening"); }));

    // Recognizer echo of the same request right after the reply
    say(harness.recognizer, "Find organic milk.");
    assert(waitUntil([&]() { return manager.stats(*id)->duplicates_suppressed == 1; }));
    assert(harness.query->calls() == 1);

    std::cout << "[PASS] test_repeat_suppressed_after_reply" << std::endl;
}

void test_barge_in() {
    Harness harness;
    harness.synth_audio_ms = 5000;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(sink->waitForType("audio_chunk", 2));

    harness.recognizer.load()->speechStarted();
    assert(sink->waitForType("playback_stopped"));
    assert(waitUntil([&]() { return manager.state(*id) == TurnState::Listening; }));

    // Nothing from the interrupted reply after playback_stopped
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    auto frames = sink->frames();
    int stopped = indexOf(frames, "playback_stopped");
    assert(indexOf(frames, "audio_chunk", stopped) < 0);
    assert(manager.stats(*id)->barge_ins == 1);

    // The user's new request goes through
    harness.recognizer.load()->transcript("I need eggs and bread", true, true);
    assert(sink->waitFor([](const std::vector<json>& f) {
        for (const auto& frame : f) {
            if (frame.value("type", "") == "assistant_response" &&
                frame.value("text", "") == "You said: I need eggs and bread") return true;
        }
        return false;
    }));

    std::cout << "[PASS] test_barge_in" << std::endl;
}

void test_interruption_disabled() {
    Harness harness;
    harness.synth_audio_ms = 600;
    core::PipelineConfig config = testConfig();
    config.session.allow_interruption = false;
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(sink->waitForType("audio_chunk"));
    harness.recognizer.load()->speechStarted();

    assert(sink->waitFor([](const std::vector<json>& f) { return statusAfterLastChunk(f, "listening"); }));
    assert(sink->count("playback_stopped") == 0);
    assert(manager.stats(*id)->barge_ins == 0);

    std::cout << "[PASS] test_interruption_disabled" << std::endl;
}

void test_greeting() {
    Harness harness;
    core::PipelineConfig config = testConfig();
    config.session.greeting = "Hi! What can I get you?";
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    assert(sink->waitFor([](const std::vector<json>& f) { return statusAfterLastChunk(f, "listening"); }));
    auto responses = sink->framesOfType("assistant_response");
    assert(responses.size() == 1);
    assert(responses[0]["text"] == "Hi! What can I get you?");
    assert(harness.query->calls() == 0);

    std::cout << "[PASS] test_greeting" << std::endl;
}

void test_query_timeout_apology() {
    Harness harness;
    harness.query->delay_ms = 600;
    core::PipelineConfig config = testConfig();
    config.turn.dispatch_timeout_ms = 150;
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(sink->waitForType("assistant_response"));
    auto response = sink->framesOfType("assistant_response")[0];
    assert(response["text"] == config.turn.apology_text);

    // The late answer must not be spoken
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    assert(sink->count("assistant_response") == 1);
    assert(manager.stats(*id)->apologies == 1);

    std::cout << "[PASS] test_query_timeout_apology" << std::endl;
}

void test_stuck_query_does_not_block_session() {
    Harness harness;
    harness.synth_audio_ms = 100;
    harness.query->hold("organic milk");
    core::PipelineConfig config = testConfig();
    config.turn.dispatch_timeout_ms = 150;
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(sink->waitForType("assistant_response"));
    assert(sink->framesOfType("assistant_response")[0]["text"] == config.turn.apology_text);
    assert(sink->waitFor([](const std::vector<json>& f) { return statusAfterLastChunk(f, "listening"); }));

    // The next request goes out while the first call is still stuck
    say(harness.recognizer, "I need eggs and bread");
    assert(sink->waitFor([](const std::vector<json>& f) {
        for (const auto& frame : f) {
            if (frame.value("type", "") == "assistant_response" &&
                frame.value("text", "") == "You said: I need eggs and bread") return true;
        }
        return false;
    }));
    assert(harness.query->calls() == 2);
    assert(harness.query->inFlight() == 1);

    auto started = std::chrono::steady_clock::now();
    manager.close(*id);
    assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500));
    assert(manager.activeSessions() == 0);
    assert(sink->closed());

    harness.query->release();
    assert(waitUntil([&]() { return harness.query->inFlight() == 0; }));

    std::cout << "[PASS] test_stuck_query_does_not_block_session" << std::endl;
}

void test_query_error_apology() {
    Harness harness;
    harness.query->responder = [](const Utterance&, const SessionContext&) {
        return QueryResult::failure("inventory offline");
    };
    core::PipelineConfig config = testConfig();
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(sink->waitForType("assistant_response"));
    assert(sink->framesOfType("assistant_response")[0]["text"] == config.turn.apology_text);
    assert(sink->count("structured") == 0);

    std::cout << "[PASS] test_query_error_apology" << std::endl;
}

void test_client_stop() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    manager.onControl(*id, R"({"type": "ping"})");
    manager.onControl(*id, "{ nope");
    manager.onControl(*id, R"({"type": "rewind"})");
    assert(sink->waitForType("pong"));
    assert(manager.activeSessions() == 1);

    manager.onControl(*id, R"({"type": "stop"})");
    assert(sink->waitForClose());
    assert(waitUntil([&]() { return manager.activeSessions() == 0; }));
    assert(sink->count("error") == 0);
    assert(sink->count("pong") == 1);
    assert(manager.onAudio(*id, std::vector<uint8_t>(640, 0)) == audio::IngestStatus::Closed);

    std::cout << "[PASS] test_client_stop" << std::endl;
}

void test_audio_reaches_recognizer() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    for (int i = 0; i < 10; ++i) {
        assert(manager.onAudio(*id, std::vector<uint8_t>(640, 0)) == audio::IngestStatus::Ok);
    }
    assert(waitUntil([&]() { return harness.recognizer.load()->frames == 10; }));
    assert(manager.stats(*id)->frames_received == 10);
    assert(manager.onAudio("sess-unknown", std::vector<uint8_t>(640, 0)) == audio::IngestStatus::Closed);

    std::cout << "[PASS] test_audio_reaches_recognizer" << std::endl;
}

void test_recognizer_failure_ends_session() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    // Upstream drops and the single reconnect attempt fails too
    harness.recognizer.load()->failing_starts = 1;
    harness.recognizer.load()->dropConnection();

    assert(sink->waitForClose());
    auto errors = sink->framesOfType("error");
    assert(errors.size() == 1);
    assert(errors[0]["message"] == "speech recognition unavailable");
    assert(waitUntil([&]() { return manager.activeSessions() == 0; }));

    std::cout << "[PASS] test_recognizer_failure_ends_session" << std::endl;
}

void test_recognizer_reconnects_transparently() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    FakeRecognizer* recognizer = harness.recognizer;
    recognizer->dropConnection();
    assert(waitUntil([&]() { return manager.stats(*id)->reconnects == 1; }));

    say(recognizer, "find organic milk");
    assert(sink->waitForType("assistant_response"));
    assert(!sink->closed());

    std::cout << "[PASS] test_recognizer_reconnects_transparently" << std::endl;
}

void test_open_failures() {
    {
        Harness harness;
        core::PipelineConfig config = testConfig();
        config.recognizer.vendor = "nonexistent";
        SessionManager manager(config, harness.providers());
        auto sink = std::make_shared<RecordingSink>();

        assert(!manager.open(sink).has_value());
        assert(sink->closed());
        auto errors = sink->framesOfType("error");
        assert(errors.size() == 1);
        assert(errors[0]["message"].get<std::string>().find("nonexistent") != std::string::npos);
        assert(manager.activeSessions() == 0);
    }
    {
        Harness harness;
        harness.failing_recognizer_starts = 1;
        SessionManager manager(testConfig(), harness.providers());
        auto sink = std::make_shared<RecordingSink>();

        assert(!manager.open(sink).has_value());
        assert(sink->closed());
        assert(sink->count("error") == 1);
    }

    std::cout << "[PASS] test_open_failures" << std::endl;
}

void test_session_ending_at_open_is_reaped() {
    Harness harness;
    harness.failing_synth_calls = 100;
    core::PipelineConfig config = testConfig();
    config.session.greeting = "Hi! What can I get you?";
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();

    // The greeting cannot be spoken, so the session ends right after opening
    auto id = manager.open(sink);
    assert(id);
    assert(sink->waitForClose());
    assert(sink->count("error") == 1);
    assert(waitUntil([&]() { return manager.activeSessions() == 0; }));
    assert(!manager.state(*id).has_value());

    std::cout << "[PASS] test_session_ending_at_open_is_reaped" << std::endl;
}

void test_transport_failure_ends_session() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    sink->fail_after = 3;   // session_started + status idle + transcript, then the transport dies
    auto id = manager.open(sink);
    assert(id);

    say(harness.recognizer, "find organic milk");
    assert(waitUntil([&]() { return manager.activeSessions() == 0; }));
    assert(sink->closed());

    std::cout << "[PASS] test_transport_failure_ends_session" << std::endl;
}

void test_idle_timeout() {
    Harness harness;
    core::PipelineConfig config = testConfig();
    config.session.idle_timeout_ms = 300;
    SessionManager manager(config, harness.providers());
    auto sink = std::make_shared<RecordingSink>();
    auto id = manager.open(sink);
    assert(id);

    assert(sink->waitForClose(std::chrono::milliseconds(3000)));
    auto errors = sink->framesOfType("error");
    assert(errors.size() == 1);
    assert(errors[0]["message"] == "session timed out");
    assert(waitUntil([&]() { return manager.activeSessions() == 0; }));

    std::cout << "[PASS] test_idle_timeout" << std::endl;
}

void test_shutdown_closes_everything() {
    Harness harness;
    SessionManager manager(testConfig(), harness.providers());
    auto first = std::make_shared<RecordingSink>();
    auto second = std::make_shared<RecordingSink>();
    assert(manager.open(first));
    assert(manager.open(second));
    assert(manager.activeSessions() == 2);

    manager.shutdown();
    assert(first->closed() && second->closed());
    assert(manager.activeSessions() == 0);
    assert(!manager.open(std::make_shared<RecordingSink>()).has_value());

    std::cout << "[PASS] test_shutdown_closes_everything" << std::endl;
}

int main() {
    std::cout << "=== Session Tests ===" << std::endl;

    test_full_turn();
    test_repeat_suppressed_after_reply();
    test_barge_in();
    test_interruption_disabled();
    test_greeting();
    test_query_timeout_apology();
    test_stuck_query_does_not_block_session();
    test_query_error_apology();
    test_client_stop();
    test_audio_reaches_recognizer();
    test_recognizer_failure_ends_session();
    test_recognizer_reconnects_transparently();
    test_open_failures();
    test_session_ending_at_open_is_reaped();
    test_transport_failure_ends_session();
    test_idle_timeout();
    test_shutdown_closes_everything();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
