/**
 * Config.hpp - Pipeline configuration
 *
 * Every field has an in-code default. loadConfig() overlays a JSON file
 * (all keys optional) and then the VSP_* environment variables.
 */

#pragma once

#include "vsp/core/Types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vsp::core {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct IngestConfig {
    AudioFormat format{16000, 1};
    int queue_ms = 3000;         // bounded queue horizon
    int nominal_frame_ms = 20;   // used to size the queue in frames
    int poll_ms = 20;

    size_t queueFrames() const;
};

struct TurnConfig {
    int silence_window_ms = 1000;
    int dedup_window_ms = 2000;
    int dispatch_timeout_ms = 10000;
    float min_confidence = 0.3f;
    size_t history_limit = 20;
    std::string apology_text =
        "I'm sorry, I had trouble processing that. Could you please try again?";
};

struct RecognizerConfig {
    std::string vendor = "whisper";
    AudioFormat format{16000, 1};
    std::string language = "en";

    // whisper
    std::string model_path = "models/whisper/ggml-small-q5_1.bin";
    int threads = 4;
    int vad_mode = 2;            // libfvad aggressiveness 0..3
    int vad_frame_ms = 20;
    int endpoint_silence_ms = 600;
    int min_speech_ms = 200;

    // mock
    std::vector<std::string> mock_script = {
        "find organic milk",
        "I need eggs and bread",
        "what's on sale today?",
    };
    float mock_energy_threshold = 0.02f;
};

struct SynthesisConfig {
    std::string vendor = "http";
    AudioFormat format{24000, 1};
    std::string server_url = "http://localhost:5050";
    int connect_timeout_ms = 2000;
    int chunk_ms = 100;
    int horizon_ms = 250;        // max produced-but-unsent audio
    int client_buffer_ms = 500;  // max audio ahead of real time at the client
};

struct QueryConfig {
    std::string base_url = "http://localhost:8080";
    std::string path = "/query";
};

struct SessionConfig {
    int idle_timeout_ms = 300000;
    int coordinator_tick_ms = 20;
    int inbox_capacity = 256;
    bool allow_interruption = true;
    std::string greeting;
};

struct PipelineConfig {
    IngestConfig ingest;
    TurnConfig turn;
    RecognizerConfig recognizer;
    SynthesisConfig synthesis;
    QueryConfig query;
    SessionConfig session;
};

/// Overlays the keys present in `doc` onto `config`. Throws ConfigError on
/// type mismatches or out-of-range values.
void applyJson(PipelineConfig& config, const nlohmann::json& doc);

/// Applies VSP_SILENCE_WINDOW_MS, VSP_DISPATCH_TIMEOUT_MS, VSP_QUERY_URL,
/// VSP_RECOGNIZER and VSP_SYNTHESIZER when set.
void applyEnvironment(PipelineConfig& config);

/// Defaults + file (if path non-empty) + environment.
PipelineConfig loadConfig(const std::string& path);

void validate(const PipelineConfig& config);

} // namespace vsp::core
