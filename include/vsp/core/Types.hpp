/**
 * Types.hpp - Data model shared by every pipeline stage
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vsp {

/// Single source of truth for "what is happening now" in a conversation.
enum class TurnState {
    Idle,
    Listening,
    Dispatching,
    Speaking
};

const char* toString(TurnState state);

/// Normalized recognizer output. Immutable once produced.
struct TranscriptEvent {
    std::string text;
    float confidence = 0.0f;      // 0..1
    bool is_final = false;
    bool is_speech_start = false;
    bool is_endpoint = false;     // provider-signaled utterance end
};

/// A finished user turn handed to the query subsystem.
struct Utterance {
    std::string text;
    std::string dispatch_id;      // "<hash>-<sequence>"
    uint64_t dedup_key = 0;       // hash of normalized text
    uint64_t sequence = 0;
};

struct SynthesisChunk {
    uint64_t response_id = 0;
    uint64_t sequence = 0;
    std::vector<uint8_t> payload; // PCM16 mono little endian
    bool is_last = false;
};

struct QueryResult {
    std::string reply_text;
    nlohmann::json structured_payload;  // opaque, null when absent
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }

    static QueryResult failure(std::string message) {
        QueryResult result;
        result.error = std::move(message);
        return result;
    }
};

struct ConversationEntry {
    enum class Role { User, Assistant };

    Role role = Role::User;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

const char* toString(ConversationEntry::Role role);

/// What the query subsystem gets to see about the session.
struct SessionContext {
    std::string session_id;
    std::optional<std::string> user_id;
    std::vector<ConversationEntry> history;
};

/// Raw PCM layout. Only 16-bit little endian PCM is carried.
struct AudioFormat {
    int sample_rate = 16000;
    int channels = 1;

    int bytesPerSecond() const { return sample_rate * channels * 2; }

    size_t bytesFor(std::chrono::milliseconds duration) const {
        size_t bytes = static_cast<size_t>(bytesPerSecond()) * duration.count() / 1000;
        return bytes - bytes % (static_cast<size_t>(channels) * 2);
    }

    std::chrono::milliseconds durationOf(size_t bytes) const {
        return std::chrono::milliseconds(
            static_cast<int64_t>(bytes) * 1000 / bytesPerSecond());
    }
};

} // namespace vsp
