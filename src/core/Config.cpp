/**
 * Config.cpp - JSON + environment configuration loader
 */

#include "vsp/core/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace vsp::core {

namespace {

template <typename T>
void read(const json& section, const char* key, T& field) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    try {
        field = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

void readFormat(const json& section, AudioFormat& format) {
    read(section, "sample_rate", format.sample_rate);
    read(section, "channels", format.channels);
}

const json& sectionOf(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

bool envInt(const char* name, int& out) {
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    try {
        out = std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    return true;
}

bool envString(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    out = value;
    return true;
}

} // anonymous namespace

size_t IngestConfig::queueFrames() const {
    int frame_ms = nominal_frame_ms > 0 ? nominal_frame_ms : 20;
    int frames = queue_ms / frame_ms;
    return static_cast<size_t>(frames > 0 ? frames : 1);
}

void applyJson(PipelineConfig& config, const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    const json& ingest = sectionOf(doc, "ingest");
    readFormat(ingest, config.ingest.format);
    read(ingest, "queue_ms", config.ingest.queue_ms);
    read(ingest, "nominal_frame_ms", config.ingest.nominal_frame_ms);
    read(ingest, "poll_ms", config.ingest.poll_ms);

    const json& turn = sectionOf(doc, "turn");
    read(turn, "silence_window_ms", config.turn.silence_window_ms);
    read(turn, "dedup_window_ms", config.turn.dedup_window_ms);
    read(turn, "dispatch_timeout_ms", config.turn.dispatch_timeout_ms);
    read(turn, "min_confidence", config.turn.min_confidence);
    read(turn, "history_limit", config.turn.history_limit);
    read(turn, "apology_text", config.turn.apology_text);

    const json& recognizer = sectionOf(doc, "recognizer");
    read(recognizer, "vendor", config.recognizer.vendor);
    readFormat(recognizer, config.recognizer.format);
    read(recognizer, "language", config.recognizer.language);
    read(recognizer, "model_path", config.recognizer.model_path);
    read(recognizer, "threads", config.recognizer.threads);
    read(recognizer, "vad_mode", config.recognizer.vad_mode);
    read(recognizer, "vad_frame_ms", config.recognizer.vad_frame_ms);
    read(recognizer, "endpoint_silence_ms", config.recognizer.endpoint_silence_ms);
    read(recognizer, "min_speech_ms", config.recognizer.min_speech_ms);
    read(recognizer, "mock_script", config.recognizer.mock_script);
    read(recognizer, "mock_energy_threshold", config.recognizer.mock_energy_threshold);

    const json& synthesis = sectionOf(doc, "synthesis");
    read(synthesis, "vendor", config.synthesis.vendor);
    readFormat(synthesis, config.synthesis.format);
    read(synthesis, "server_url", config.synthesis.server_url);
    read(synthesis, "connect_timeout_ms", config.synthesis.connect_timeout_ms);
    read(synthesis, "chunk_ms", config.synthesis.chunk_ms);
    read(synthesis, "horizon_ms", config.synthesis.horizon_ms);
    read(synthesis, "client_buffer_ms", config.synthesis.client_buffer_ms);

    const json& query = sectionOf(doc, "query");
    read(query, "base_url", config.query.base_url);
    read(query, "path", config.query.path);

    const json& session = sectionOf(doc, "session");
    read(session, "idle_timeout_ms", config.session.idle_timeout_ms);
    read(session, "coordinator_tick_ms", config.session.coordinator_tick_ms);
    read(session, "inbox_capacity", config.session.inbox_capacity);
    read(session, "allow_interruption", config.session.allow_interruption);
    read(session, "greeting", config.session.greeting);
}

void applyEnvironment(PipelineConfig& config) {
    envInt("VSP_SILENCE_WINDOW_MS", config.turn.silence_window_ms);
    envInt("VSP_DISPATCH_TIMEOUT_MS", config.turn.dispatch_timeout_ms);
    envString("VSP_QUERY_URL", config.query.base_url);
    envString("VSP_RECOGNIZER", config.recognizer.vendor);
    envString("VSP_SYNTHESIZER", config.synthesis.vendor);
}

void validate(const PipelineConfig& config) {
    auto positive = [](int value, const char* name) {
        if (value <= 0) {
            throw ConfigError(std::string(name) + " must be positive");
        }
    };

    positive(config.ingest.format.sample_rate, "ingest.sample_rate");
    positive(config.ingest.queue_ms, "ingest.queue_ms");
    positive(config.turn.silence_window_ms, "turn.silence_window_ms");
    positive(config.turn.dispatch_timeout_ms, "turn.dispatch_timeout_ms");
    positive(config.synthesis.format.sample_rate, "synthesis.sample_rate");
    positive(config.synthesis.chunk_ms, "synthesis.chunk_ms");
    positive(config.synthesis.horizon_ms, "synthesis.horizon_ms");
    positive(config.session.coordinator_tick_ms, "session.coordinator_tick_ms");
    positive(config.session.inbox_capacity, "session.inbox_capacity");

    if (config.turn.min_confidence < 0.0f || config.turn.min_confidence > 1.0f) {
        throw ConfigError("turn.min_confidence must be within [0, 1]");
    }
    if (config.ingest.format.channels != 1 || config.synthesis.format.channels != 1) {
        throw ConfigError("only mono audio is supported");
    }
}

PipelineConfig loadConfig(const std::string& path) {
    PipelineConfig config;

    if (!path.empty()) {
        std::ifstream file(path);
        if (!file.good()) {
            throw ConfigError("cannot open config file: " + path);
        }

        json doc;
        try {
            doc = json::parse(file);
        } catch (const json::parse_error& e) {
            throw ConfigError("cannot parse " + path + ": " + e.what());
        }
        applyJson(config, doc);
        std::cout << "[Config] Loaded " << path << std::endl;
    }

    applyEnvironment(config);
    validate(config);
    return config;
}

} // namespace vsp::core
