/**
 * Providers.cpp - Built-in adapter registrations
 */

#include "vsp/session/Providers.hpp"
#include "vsp/query/HttpQueryClient.hpp"
#include "vsp/stt/MockRecognizer.hpp"
#include "vsp/tts/HttpSpeechSynthesizer.hpp"
#include "vsp/tts/ToneSynthesizer.hpp"

#ifdef VSP_HAS_WHISPER
#include "vsp/stt/WhisperRecognizer.hpp"
#endif

namespace vsp::session {

namespace {

template <typename Map>
std::vector<std::string> keysOf(const Map& map) {
    std::vector<std::string> keys;
    for (const auto& [name, factory] : map) keys.push_back(name);
    return keys;
}

template <typename Map>
std::string known(const Map& map) {
    std::string list;
    for (const auto& name : keysOf(map)) {
        if (!list.empty()) list += ", ";
        list += name;
    }
    return list;
}

} // anonymous namespace

Providers Providers::defaults() {
    Providers providers;

#ifdef VSP_HAS_WHISPER
    providers.registerRecognizer("whisper", [](const core::PipelineConfig&) {
        return std::make_unique<stt::WhisperRecognizer>();
    });
#endif
    providers.registerRecognizer("mock", [](const core::PipelineConfig&) {
        return std::make_unique<stt::MockRecognizer>();
    });

    providers.registerSynthesizer("http", [](const core::PipelineConfig& config) {
        return std::make_unique<tts::HttpSpeechSynthesizer>(config.synthesis);
    });
    providers.registerSynthesizer("mock", [](const core::PipelineConfig& config) {
        return std::make_unique<tts::ToneSynthesizer>(config.synthesis);
    });

    providers.setQueryClientFactory([](const core::PipelineConfig& config) {
        return std::make_shared<query::HttpQueryClient>(config.query, config.turn.dispatch_timeout_ms);
    });
    return providers;
}

void Providers::registerRecognizer(const std::string& vendor, RecognizerFactory factory) {
    recognizers_[vendor] = std::move(factory);
}

void Providers::registerSynthesizer(const std::string& vendor, SynthesizerFactory factory) {
    synthesizers_[vendor] = std::move(factory);
}

void Providers::setQueryClientFactory(QueryClientFactory factory) {
    query_factory_ = std::move(factory);
}

std::unique_ptr<stt::SpeechRecognizer> Providers::makeRecognizer(const core::PipelineConfig& config) const {
    auto it = recognizers_.find(config.recognizer.vendor);
    if (it == recognizers_.end()) {
        throw core::ConfigError("unknown recognizer '" + config.recognizer.vendor +
                                "' (available: " + known(recognizers_) + ")");
    }
    return it->second(config);
}

std::unique_ptr<tts::SpeechSynthesizer> Providers::makeSynthesizer(const core::PipelineConfig& config) const {
    auto it = synthesizers_.find(config.synthesis.vendor);
    if (it == synthesizers_.end()) {
        throw core::ConfigError("unknown synthesizer '" + config.synthesis.vendor +
                                "' (available: " + known(synthesizers_) + ")");
    }
    return it->second(config);
}

std::shared_ptr<query::QueryClient> Providers::makeQueryClient(const core::PipelineConfig& config) const {
    if (!query_factory_) {
        throw core::ConfigError("no query client configured");
    }
    return query_factory_(config);
}

std::vector<std::string> Providers::recognizers() const {
    return keysOf(recognizers_);
}

std::vector<std::string> Providers::synthesizers() const {
    return keysOf(synthesizers_);
}

} // namespace vsp::session
