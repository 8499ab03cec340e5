/**
 * Providers.hpp - Vendor adapter registry
 *
 * Sessions never name a vendor. They ask the registry for a recognizer,
 * a synthesizer and a query client matching the configuration; the
 * registry maps recognizer.vendor / synthesis.vendor to a factory.
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/query/QueryClient.hpp"
#include "vsp/stt/SpeechRecognizer.hpp"
#include "vsp/tts/SpeechSynthesizer.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vsp::session {

class Providers {
public:
    using RecognizerFactory = std::function<std::unique_ptr<stt::SpeechRecognizer>(const core::PipelineConfig&)>;
    using SynthesizerFactory = std::function<std::unique_ptr<tts::SpeechSynthesizer>(const core::PipelineConfig&)>;
    using QueryClientFactory = std::function<std::shared_ptr<query::QueryClient>(const core::PipelineConfig&)>;

    /// Built-in adapters: recognizers "whisper" (when built with whisper.cpp)
    /// and "mock", synthesizers "http" and "mock", the HTTP query client.
    static Providers defaults();

    void registerRecognizer(const std::string& vendor, RecognizerFactory factory);
    void registerSynthesizer(const std::string& vendor, SynthesizerFactory factory);
    void setQueryClientFactory(QueryClientFactory factory);

    /// Throw core::ConfigError for an unknown vendor.
    std::unique_ptr<stt::SpeechRecognizer> makeRecognizer(const core::PipelineConfig& config) const;
    std::unique_ptr<tts::SpeechSynthesizer> makeSynthesizer(const core::PipelineConfig& config) const;
    std::shared_ptr<query::QueryClient> makeQueryClient(const core::PipelineConfig& config) const;

    std::vector<std::string> recognizers() const;
    std::vector<std::string> synthesizers() const;

private:
    std::map<std::string, RecognizerFactory> recognizers_;
    std::map<std::string, SynthesizerFactory> synthesizers_;
    QueryClientFactory query_factory_;
};

} // namespace vsp::session
