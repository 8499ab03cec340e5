/**
 * MockRecognizer.hpp - Scripted recognizer for demos without a model
 *
 * An energy gate stands in for speech detection; every detected utterance
 * is "recognized" as the next line of the configured script.
 */

#pragma once

#include "vsp/stt/SpeechRecognizer.hpp"

#include <memory>

namespace vsp::stt {

class MockRecognizer : public SpeechRecognizer {
public:
    MockRecognizer();
    ~MockRecognizer() override;

    SessionHandle start(const core::RecognizerConfig& config) override;
    bool send(const uint8_t* data, size_t size) override;
    void on(EventCallback callback) override;
    void stop() override;
    std::string name() const override { return "mock"; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::stt
