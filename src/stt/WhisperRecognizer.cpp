/**
 * WhisperRecognizer.cpp - Speech-to-Text using whisper.cpp
 *
 * The model is loaded on the first start() and stays resident across
 * reconnects. Audio is decoded on a private worker thread so send() never
 * blocks the ingest loop.
 */

#include "vsp/stt/WhisperRecognizer.hpp"
#include "vsp/audio/Pcm.hpp"
#include "vsp/audio/VoiceActivityDetector.hpp"
#include "vsp/core/Channel.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "whisper.h"

namespace vsp::stt {

namespace {

// ~10 s of 20 ms blocks
constexpr size_t AUDIO_QUEUE_BLOCKS = 500;

std::atomic<uint64_t> g_next_handle{1};

} // anonymous namespace

struct WhisperRecognizer::Impl {
    whisper_context* ctx = nullptr;
    whisper_full_params params{};
    std::string model_path;
    std::string language;

    core::RecognizerConfig config;
    EventCallback callback;
    std::mutex callback_mutex;

    std::unique_ptr<core::Channel<std::vector<float>>> blocks;
    std::unique_ptr<audio::VoiceActivityDetector> vad;
    std::thread worker;
    std::atomic<uint64_t> handle{0};

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }

    bool loadModel(const core::RecognizerConfig& cfg) {
        if (ctx && model_path == cfg.model_path) return true;
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }

        model_path = cfg.model_path;
        language = cfg.language;

        struct whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
        if (!ctx) {
            std::cerr << "[WhisperRecognizer] Failed to load model: " << model_path << std::endl;
            return false;
        }

        // Greedy decoding, no context carry-over between segments
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = language.c_str();
        params.n_threads = cfg.threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.single_segment = false;
        params.no_context = true;

        std::cout << "[WhisperRecognizer] Model loaded: " << model_path
                  << " (language=" << language << ", threads=" << cfg.threads << ")" << std::endl;
        return true;
    }

    void emit(uint64_t id, const RecognizerEvent& event) {
        EventCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = callback;
        }
        if (cb) cb(SessionHandle{id}, event);
    }

    std::string transcribe(const std::vector<float>& samples, float* confidence) {
        if (!ctx || samples.empty()) return "";

        int result = whisper_full(ctx, params, samples.data(), static_cast<int>(samples.size()));
        if (result != 0) {
            std::cerr << "[WhisperRecognizer] Transcription failed: " << result << std::endl;
            return "";
        }

        std::string text;
        double p_sum = 0.0;
        int p_count = 0;
        const whisper_token eot = whisper_token_eot(ctx);
        const int n_segments = whisper_full_n_segments(ctx);

        for (int i = 0; i < n_segments; ++i) {
            const char* segment_text = whisper_full_get_segment_text(ctx, i);
            if (segment_text) text += segment_text;

            const int n_tokens = whisper_full_n_tokens(ctx, i);
            for (int j = 0; j < n_tokens; ++j) {
                if (whisper_full_get_token_id(ctx, i, j) >= eot) continue;
                p_sum += whisper_full_get_token_p(ctx, i, j);
                p_count++;
            }
        }

        if (confidence) {
            *confidence = p_count > 0 ? static_cast<float>(p_sum / p_count) : 0.0f;
        }
        return text;
    }

    void run(uint64_t id) {
        vad->onOnset([this, id]() {
            RecognizerEvent event;
            event.type = RecognizerEvent::Type::SpeechStarted;
            emit(id, event);
        });

        vad->onSegment([this, id](audio::SpeechSegment segment) {
            float confidence = 0.0f;
            RecognizerEvent event;
            event.type = RecognizerEvent::Type::Transcript;
            event.text = transcribe(segment.samples, &confidence);
            event.confidence = confidence;
            event.is_final = true;
            // A segment cut at the length cap means the speaker is still talking
            event.speech_final = !segment.truncated;
            std::cout << "[WhisperRecognizer] Segment " << segment.durationMs(SAMPLE_RATE) << "ms ("
                      << segment.voiced_ms << "ms voiced) -> \""
                      << event.text << "\"" << std::endl;
            emit(id, event);
        });

        while (auto block = blocks->pop()) {
            vad->feed(block->data(), block->size());
        }

        RecognizerEvent closed;
        closed.type = RecognizerEvent::Type::Closed;
        closed.detail = "stopped";
        emit(id, closed);
    }
};

WhisperRecognizer::WhisperRecognizer()
    : impl_(std::make_unique<Impl>()) {
}

WhisperRecognizer::~WhisperRecognizer() {
    stop();
}

SessionHandle WhisperRecognizer::start(const core::RecognizerConfig& config) {
    stop();

    if (!impl_->loadModel(config)) {
        return SessionHandle{};
    }

    impl_->config = config;
    audio::SegmenterConfig segmenter;
    segmenter.sample_rate = SAMPLE_RATE;
    segmenter.aggressiveness = config.vad_mode;
    segmenter.frame_ms = config.vad_frame_ms;
    segmenter.hangover_ms = config.endpoint_silence_ms;
    segmenter.min_speech_ms = config.min_speech_ms;
    impl_->vad = std::make_unique<audio::VoiceActivityDetector>(segmenter);
    if (!impl_->vad->isReady()) {
        return SessionHandle{};
    }

    impl_->blocks = std::make_unique<core::Channel<std::vector<float>>>(
        AUDIO_QUEUE_BLOCKS, core::OverflowPolicy::DropOldest);

    uint64_t id = g_next_handle++;
    impl_->handle = id;
    impl_->worker = std::thread([this, id]() { impl_->run(id); });
    return SessionHandle{id};
}

bool WhisperRecognizer::send(const uint8_t* data, size_t size) {
    if (impl_->handle == 0 || !impl_->blocks) return false;

    std::vector<float> samples = audio::pcm16ToFloat(data, size);
    if (impl_->config.format.sample_rate != SAMPLE_RATE) {
        samples = audio::resample(samples, impl_->config.format.sample_rate, SAMPLE_RATE);
    }
    return impl_->blocks->push(std::move(samples)).accepted;
}

void WhisperRecognizer::on(EventCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

void WhisperRecognizer::stop() {
    if (impl_->blocks) {
        impl_->blocks->close();
    }
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
    impl_->handle = 0;
    impl_->blocks.reset();
    impl_->vad.reset();
}

bool WhisperRecognizer::load(const core::RecognizerConfig& config) {
    return impl_->loadModel(config);
}

bool WhisperRecognizer::isModelLoaded() const {
    return impl_->ctx != nullptr;
}

std::string WhisperRecognizer::transcribe(const std::vector<float>& audio, float* confidence) {
    return impl_->transcribe(audio, confidence);
}

} // namespace vsp::stt
