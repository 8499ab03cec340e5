/**
 * TranscriptionStream.cpp - Recognizer event normalization and reconnect policy
 *
 * An unexpected Closed (or a failed send) schedules exactly one reconnect
 * with the same configuration. If that attempt fails the stream reports a
 * terminal failure and stays unavailable.
 */

#include "vsp/stt/TranscriptionStream.hpp"
#include "vsp/core/TextUtils.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>

namespace vsp::stt {

struct TranscriptionStream::Impl {
    std::unique_ptr<SpeechRecognizer> recognizer;
    core::RecognizerConfig config;

    std::mutex sink_mutex;
    EventSink event_sink;
    FailureSink failure_sink;

    std::atomic<uint64_t> current_handle{0};
    std::atomic<bool> available{false};
    std::atomic<bool> reconnect_pending{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> failed{false};
    std::atomic<int> reconnect_count{0};

    Impl(std::unique_ptr<SpeechRecognizer> rec, core::RecognizerConfig cfg)
        : recognizer(std::move(rec)), config(std::move(cfg)) {}

    void handleEvent(SessionHandle handle, const RecognizerEvent& raw) {
        if (!handle.valid() || handle.id != current_handle.load()) {
            return;  // from a replaced upstream session
        }

        switch (raw.type) {
            case RecognizerEvent::Type::Closed:
                if (stopping) return;
                std::cerr << "[TranscriptionStream] Upstream closed unexpectedly"
                          << (raw.detail.empty() ? "" : ": " + raw.detail) << std::endl;
                scheduleReconnect();
                return;
            case RecognizerEvent::Type::Error:
                std::cerr << "[TranscriptionStream] Recognizer error: " << raw.detail << std::endl;
                return;
            default:
                break;
        }

        TranscriptEvent event;
        if (!normalize(raw, event)) return;

        EventSink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            sink = event_sink;
        }
        if (sink) sink(event);
    }

    void scheduleReconnect() {
        available = false;
        reconnect_pending = true;
    }

    void fail(const std::string& reason) {
        if (failed.exchange(true)) return;
        available = false;
        std::cerr << "[TranscriptionStream] " << reason << std::endl;

        FailureSink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            sink = failure_sink;
        }
        if (sink) sink(reason);
    }
};

TranscriptionStream::TranscriptionStream(std::unique_ptr<SpeechRecognizer> recognizer,
                                         core::RecognizerConfig config)
    : impl_(std::make_unique<Impl>(std::move(recognizer), std::move(config))) {
    Impl* impl = impl_.get();
    impl_->recognizer->on([impl](SessionHandle handle, const RecognizerEvent& event) {
        impl->handleEvent(handle, event);
    });
}

TranscriptionStream::~TranscriptionStream() {
    stop();
}

void TranscriptionStream::setEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(impl_->sink_mutex);
    impl_->event_sink = std::move(sink);
}

void TranscriptionStream::setFailureSink(FailureSink sink) {
    std::lock_guard<std::mutex> lock(impl_->sink_mutex);
    impl_->failure_sink = std::move(sink);
}

bool TranscriptionStream::start() {
    impl_->stopping = false;

    SessionHandle handle = impl_->recognizer->start(impl_->config);
    if (!handle.valid()) {
        std::cerr << "[TranscriptionStream] Failed to start " << impl_->recognizer->name()
                  << " recognizer" << std::endl;
        return false;
    }

    impl_->current_handle = handle.id;
    impl_->available = true;
    std::cout << "[TranscriptionStream] Started " << impl_->recognizer->name()
              << " (session " << handle.id << ")" << std::endl;
    return true;
}

bool TranscriptionStream::send(const std::vector<uint8_t>& audio) {
    if (!impl_->available || audio.empty()) {
        return false;
    }

    if (!impl_->recognizer->send(audio.data(), audio.size())) {
        std::cerr << "[TranscriptionStream] Send failed, scheduling reconnect" << std::endl;
        impl_->scheduleReconnect();
        return false;
    }
    return true;
}

void TranscriptionStream::service() {
    if (impl_->stopping || impl_->failed) return;
    if (!impl_->reconnect_pending.exchange(false)) return;

    // Detach the old session first so its trailing events are ignored
    impl_->current_handle = 0;
    impl_->recognizer->stop();

    std::cout << "[TranscriptionStream] Reconnecting " << impl_->recognizer->name() << "..."
              << std::endl;
    SessionHandle handle = impl_->recognizer->start(impl_->config);
    if (!handle.valid()) {
        impl_->fail("Recognizer reconnect failed");
        return;
    }

    impl_->current_handle = handle.id;
    impl_->reconnect_count++;
    impl_->available = true;
    std::cout << "[TranscriptionStream] Reconnected (session " << handle.id << ")" << std::endl;
}

void TranscriptionStream::stop() {
    if (impl_->stopping.exchange(true)) return;
    impl_->available = false;
    impl_->reconnect_pending = false;
    impl_->recognizer->stop();
    impl_->current_handle = 0;
}

bool TranscriptionStream::isAvailable() const {
    return impl_->available;
}

bool TranscriptionStream::hasFailed() const {
    return impl_->failed;
}

int TranscriptionStream::reconnects() const {
    return impl_->reconnect_count;
}

std::string TranscriptionStream::recognizerName() const {
    return impl_->recognizer->name();
}

bool TranscriptionStream::normalize(const RecognizerEvent& raw, TranscriptEvent& out) {
    out = TranscriptEvent{};

    switch (raw.type) {
        case RecognizerEvent::Type::Transcript: {
            std::string text = core::trim(raw.text);
            if (text.empty() && !raw.speech_final) return false;
            out.text = std::move(text);
            out.confidence = std::clamp(raw.confidence, 0.0f, 1.0f);
            // speech_final implies the hypothesis is final too
            out.is_final = raw.is_final || raw.speech_final;
            out.is_endpoint = raw.speech_final;
            return true;
        }
        case RecognizerEvent::Type::SpeechStarted:
            out.is_speech_start = true;
            return true;
        case RecognizerEvent::Type::UtteranceEnd:
            out.is_endpoint = true;
            return true;
        case RecognizerEvent::Type::Closed:
        case RecognizerEvent::Type::Error:
            return false;
    }
    return false;
}

} // namespace vsp::stt
