#pragma once

#include "audio/audio_segment.hpp"
#include "queue/message_broker.hpp"
#include "stt/transcription_provider.hpp"
#include <string>

namespace voicebridge {
namespace queue {

namespace headers {
    constexpr const char* SESSION_ID = "session-id";
    constexpr const char* SEQUENCE = "sequence";
    constexpr const char* ATTEMPT_ID = "attempt-id";
    constexpr const char* CODEC = "codec";
    constexpr const char* SAMPLE_RATE = "sample-rate";
    constexpr const char* CHANNELS = "channels";
    constexpr const char* BITS_PER_SAMPLE = "bits-per-sample";
    constexpr const char* FINAL_CHUNK = "final-chunk";
    constexpr const char* CAPTURED_AT = "captured-at-ms";
    constexpr const char* IS_FINAL = "is-final";
}

// Segment envelopes carry the raw audio as payload and metadata as headers
BrokerMessage encodeSegment(const std::string& topic, const audio::AudioSegment& segment,
                            const std::string& attemptId);

// Throws std::invalid_argument when required headers are missing or malformed
audio::AudioSegment decodeSegment(const BrokerMessage& message);

// Result envelopes carry the result as a JSON payload
BrokerMessage encodeResult(const std::string& topic, const stt::TranscriptionResult& result);
stt::TranscriptionResult decodeResult(const BrokerMessage& message);

} // namespace queue
} // namespace voicebridge
