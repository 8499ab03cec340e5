/**
 * vsp_local - Voice session pipeline on the local microphone and speaker
 *
 * Runs one conversation session with PortAudio as the client transport:
 * captured audio is fed to the session, JSON frames are printed and
 * audio_chunk frames are played back.
 */

#include "vsp/SessionManager.hpp"
#include "vsp/audio/AudioEngine.hpp"
#include "vsp/core/Config.hpp"
#include "vsp/core/TextUtils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

namespace {

/// Client side of the session: the speaker and the terminal.
class SpeakerSink : public vsp::session::ClientSink {
public:
    explicit SpeakerSink(vsp::audio::AudioEngine& engine) : engine_(engine) {}

    bool sendText(const std::string& frame) override {
        json doc;
        try {
            doc = json::parse(frame);
        } catch (const json::exception& e) {
            std::cerr << "[vsp_local] Bad frame: " << e.what() << std::endl;
            return true;
        }

        std::string type = doc.value("type", "");
        if (type == "audio_chunk") {
            if (!engine_.play(vsp::core::base64Decode(doc.value("payload", "")))) {
                std::cerr << "[vsp_local] Playback queue full, dropped audio" << std::endl;
            }
        } else if (type == "playback_stopped") {
            engine_.flush();
            std::cout << "[vsp_local] (interrupted)" << std::endl;
        } else if (type == "transcript") {
            if (doc.value("is_final", false)) {
                std::cout << "[vsp_local] You: " << doc.value("text", "") << std::endl;
            }
        } else if (type == "assistant_response") {
            std::cout << "[vsp_local] Assistant: " << doc.value("text", "") << std::endl;
        } else if (type == "session_started") {
            std::cout << "[vsp_local] Session " << doc.value("session_id", "") << std::endl;
        } else if (type == "status") {
            std::cout << "[vsp_local] <" << doc.value("state", "") << ">" << std::endl;
        } else {
            std::cout << "[vsp_local] " << frame << std::endl;
        }
        return true;
    }

    void close() override {
        closed_ = true;
    }

    bool closed() const { return closed_; }

private:
    vsp::audio::AudioEngine& engine_;
    std::atomic<bool> closed_{false};
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <file.json>] [--user <id>] [--list-devices]" << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string config_path;
    std::optional<std::string> user_id;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user_id = argv[++i];
        } else if (std::strcmp(argv[i], "--list-devices") == 0) {
            for (const auto& device : vsp::audio::AudioEngine::devices()) {
                std::cout << device.index << ": " << device.name
                          << (device.can_capture ? " [in]" : "")
                          << (device.can_play ? " [out]" : "") << std::endl;
            }
            return 0;
        } else {
            printUsage(argv[0]);
            return std::strcmp(argv[i], "--help") == 0 ? 0 : 1;
        }
    }

    vsp::core::PipelineConfig config;
    try {
        config = vsp::core::loadConfig(config_path);
    } catch (const vsp::core::ConfigError& e) {
        std::cerr << "[vsp_local] Configuration error: " << e.what() << std::endl;
        return 1;
    }

    vsp::audio::DeviceConfig devices;
    devices.capture_rate = config.ingest.format.sample_rate;
    devices.playback_rate = config.synthesis.format.sample_rate;
    devices.capture_frame_ms = config.ingest.nominal_frame_ms;

    vsp::audio::AudioEngine engine(devices);
    if (!engine.open()) {
        std::cerr << "[vsp_local] " << engine.lastError() << std::endl;
        return 1;
    }

    auto sink = std::make_shared<SpeakerSink>(engine);
    vsp::SessionManager manager(config);

    auto session_id = manager.open(sink, user_id);
    if (!session_id) {
        std::cerr << "[vsp_local] Could not open a session" << std::endl;
        return 1;
    }

    engine.onCapture([&manager, id = *session_id](std::vector<uint8_t> frame) {
        manager.onAudio(id, std::move(frame));
    });

    if (!engine.start()) {
        std::cerr << "[vsp_local] " << engine.lastError() << std::endl;
        manager.shutdown();
        return 1;
    }

    std::cout << "[vsp_local] Listening... (Ctrl+C to quit)" << std::endl;
    while (g_running && !sink->closed()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[vsp_local] Shutting down..." << std::endl;
    engine.close();
    manager.shutdown();
    return 0;
}
