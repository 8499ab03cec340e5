/**
 * HttpSpeechSynthesizer.cpp - XTTS server client
 *
 * Uses cpp-httplib with Request.content_receiver so a cancel() lands while
 * the WAV body is still downloading.
 */

#include "vsp/tts/HttpSpeechSynthesizer.hpp"
#include "vsp/audio/Pcm.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <regex>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vsp::tts {

struct HttpSpeechSynthesizer::Impl {
    core::SynthesisConfig config;
    std::unique_ptr<httplib::Client> client;
    std::atomic<bool> cancelled{false};

    explicit Impl(const core::SynthesisConfig& cfg) : config(cfg) {
        reset();
    }

    void reset() {
        int timeout_ms = config.connect_timeout_ms;
        client = std::make_unique<httplib::Client>(config.server_url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        // Synthesis of a long sentence takes a while on CPU
        client->set_read_timeout(30, 0);
        client->set_keep_alive(true);
    }

    enum class Outcome { Audio, Cancelled, Failed };

    Outcome fetch(const std::string& sentence, std::vector<uint8_t>& wav) {
        httplib::Request req;
        req.method = "POST";
        req.path = "/synthesize";
        req.set_header("Content-Type", "application/json");
        req.body = json{{"text", sentence}}.dump();

        req.content_receiver = [&](const char* data, size_t data_length,
                                   uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
            if (cancelled) return false;
            wav.insert(wav.end(), data, data + data_length);
            return true;
        };

        auto result = client->send(req);
        if (cancelled) return Outcome::Cancelled;

        if (!result) {
            std::cerr << "[HttpSpeechSynthesizer] Request failed: "
                      << httplib::to_string(result.error()) << std::endl;
            return Outcome::Failed;
        }
        if (result->status != 200) {
            std::cerr << "[HttpSpeechSynthesizer] Server returned " << result->status << std::endl;
            return Outcome::Failed;
        }
        return Outcome::Audio;
    }
};

HttpSpeechSynthesizer::HttpSpeechSynthesizer(const core::SynthesisConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

HttpSpeechSynthesizer::~HttpSpeechSynthesizer() = default;

bool HttpSpeechSynthesizer::connect() {
    impl_->reset();
    auto res = impl_->client->Get("/health");
    if (!res || res->status != 200) {
        std::cerr << "[HttpSpeechSynthesizer] Server not reachable at "
                  << impl_->config.server_url << std::endl;
        return false;
    }
    std::cout << "[HttpSpeechSynthesizer] Connected to " << impl_->config.server_url << std::endl;
    return true;
}

bool HttpSpeechSynthesizer::synthesize(const std::string& text, const AudioCallback& onAudio) {
    impl_->cancelled = false;

    const AudioFormat out = impl_->config.format;
    const size_t piece_bytes = std::max<size_t>(
        out.bytesFor(std::chrono::milliseconds(impl_->config.chunk_ms)), 2);

    for (const auto& sentence : splitSentences(text)) {
        if (impl_->cancelled) return true;

        std::vector<uint8_t> wav;
        auto outcome = impl_->fetch(sentence, wav);
        if (outcome == Impl::Outcome::Cancelled) return true;
        if (outcome == Impl::Outcome::Failed) return false;

        auto parsed = audio::parseWav(wav);
        if (!parsed) {
            std::cerr << "[HttpSpeechSynthesizer] Unreadable WAV (" << wav.size() << " bytes)" << std::endl;
            return false;
        }

        std::vector<float> samples = audio::resample(parsed->samples, parsed->sample_rate, out.sample_rate);
        std::vector<uint8_t> pcm = audio::floatToPcm16(samples.data(), samples.size());

        for (size_t offset = 0; offset < pcm.size(); offset += piece_bytes) {
            if (impl_->cancelled) return true;
            size_t size = std::min(piece_bytes, pcm.size() - offset);
            if (!onAudio(pcm.data() + offset, size)) return true;
        }
    }
    return true;
}

void HttpSpeechSynthesizer::cancel() {
    impl_->cancelled = true;
}

AudioFormat HttpSpeechSynthesizer::format() const {
    return impl_->config.format;
}

std::vector<std::string> HttpSpeechSynthesizer::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::regex sentence_regex(R"([^.!?]+[.!?]+\s*)");

    auto begin = std::sregex_iterator(text.begin(), text.end(), sentence_regex);
    auto end = std::sregex_iterator();

    size_t consumed = 0;
    for (auto it = begin; it != end; ++it) {
        std::string sentence = it->str();
        consumed = static_cast<size_t>(it->position() + it->length());
        while (!sentence.empty() && std::isspace(static_cast<unsigned char>(sentence.back()))) {
            sentence.pop_back();
        }
        if (!sentence.empty()) sentences.push_back(sentence);
    }

    // Trailing text without terminal punctuation
    if (consumed < text.size()) {
        std::string rest = text.substr(consumed);
        auto first = rest.find_first_not_of(" \t\r\n");
        if (first != std::string::npos) {
            sentences.push_back(rest.substr(first));
        }
    }
    return sentences;
}

} // namespace vsp::tts
