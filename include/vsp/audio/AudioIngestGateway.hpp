/**
 * AudioIngestGateway.hpp - Client audio frames into the transcription stream
 *
 * ingest() never blocks the transport: frames go into a bounded queue
 * (sized to IngestConfig::queue_ms of audio) and the oldest frames are
 * evicted when it is full. A dedicated ingest loop drains the queue into
 * the TranscriptionStream and services its reconnects.
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/stt/TranscriptionStream.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace vsp::audio {

enum class IngestStatus {
    Ok,
    RecognizerUnavailable,   // no upstream session, frame dropped
    Closed
};

const char* toString(IngestStatus status);

struct IngestCounters {
    uint64_t received = 0;
    uint64_t forwarded = 0;
    uint64_t dropped_backpressure = 0;
    uint64_t dropped_unavailable = 0;
};

class AudioIngestGateway {
public:
    using BackpressureCallback = std::function<void(size_t dropped)>;

    AudioIngestGateway(stt::TranscriptionStream& stream, const core::IngestConfig& config);
    ~AudioIngestGateway();

    AudioIngestGateway(const AudioIngestGateway&) = delete;
    AudioIngestGateway& operator=(const AudioIngestGateway&) = delete;

    /// Called on the transport thread whenever frames are evicted.
    void setBackpressureCallback(BackpressureCallback callback);

    void start();
    IngestStatus ingest(std::vector<uint8_t> frame);
    void stop();

    IngestCounters counters() const;
    size_t queued() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::audio
