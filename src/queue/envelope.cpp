#include "queue/envelope.hpp"
#include "utils/json_utils.hpp"
#include <stdexcept>

namespace voicebridge {
namespace queue {

namespace {

const std::string& required(const BrokerMessage& message, const char* name) {
    auto it = message.headers.find(name);
    if (it == message.headers.end()) {
        throw std::invalid_argument(std::string("missing header ") + name);
    }
    return it->second;
}

uint64_t toUnsigned(const std::string& value, const char* name) {
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("malformed header ") + name + ": " + value);
    }
}

} // namespace

BrokerMessage encodeSegment(const std::string& topic, const audio::AudioSegment& segment,
                            const std::string& attemptId) {
    BrokerMessage message;
    message.topic = topic;
    message.key = segment.sessionId;
    message.headers[headers::SESSION_ID] = segment.sessionId;
    message.headers[headers::SEQUENCE] = std::to_string(segment.sequence);
    message.headers[headers::ATTEMPT_ID] = attemptId;
    message.headers[headers::CODEC] = segment.format.codec;
    message.headers[headers::SAMPLE_RATE] = std::to_string(segment.format.sampleRate);
    message.headers[headers::CHANNELS] = std::to_string(segment.format.channels);
    message.headers[headers::BITS_PER_SAMPLE] = std::to_string(segment.format.bitsPerSample);
    message.headers[headers::FINAL_CHUNK] = segment.isFinalChunk ? "1" : "0";
    message.headers[headers::CAPTURED_AT] = std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(segment.capturedAt.time_since_epoch()).count());
    message.payload = segment.payload;
    return message;
}

audio::AudioSegment decodeSegment(const BrokerMessage& message) {
    audio::AudioSegment segment;
    segment.sessionId = required(message, headers::SESSION_ID);
    segment.sequence = toUnsigned(required(message, headers::SEQUENCE), headers::SEQUENCE);
    segment.format.codec = message.header(headers::CODEC, segment.format.codec);
    segment.format.sampleRate = static_cast<uint32_t>(
        toUnsigned(required(message, headers::SAMPLE_RATE), headers::SAMPLE_RATE));
    segment.format.channels = static_cast<uint16_t>(
        toUnsigned(required(message, headers::CHANNELS), headers::CHANNELS));
    segment.format.bitsPerSample = static_cast<uint16_t>(
        toUnsigned(required(message, headers::BITS_PER_SAMPLE), headers::BITS_PER_SAMPLE));
    segment.isFinalChunk = message.header(headers::FINAL_CHUNK) == "1";
    std::string captured = message.header(headers::CAPTURED_AT);
    if (!captured.empty()) {
        segment.capturedAt = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(toUnsigned(captured, headers::CAPTURED_AT)));
    }
    segment.payload = message.payload;
    if (!segment.format.isValid()) {
        throw std::invalid_argument("invalid audio format in segment envelope");
    }
    return segment;
}

BrokerMessage encodeResult(const std::string& topic, const stt::TranscriptionResult& result) {
    utils::JsonValue json;
    json.setObject();
    json.setObjectProperty("sessionId", utils::JsonValue(result.sessionId));
    json.setObjectProperty("sequence", utils::JsonValue(static_cast<int64_t>(result.sequence)));
    json.setObjectProperty("text", utils::JsonValue(result.text));
    json.setObjectProperty("confidence", utils::JsonValue(static_cast<double>(result.confidence)));
    json.setObjectProperty("isFinal", utils::JsonValue(result.isFinal));
    json.setObjectProperty("provider", utils::JsonValue(result.provider));
    json.setObjectProperty("latencyMs", utils::JsonValue(static_cast<int64_t>(result.latency.count())));
    json.setObjectProperty("attemptId", utils::JsonValue(result.attemptId));
    json.setObjectProperty("timestamp", utils::JsonValue(result.timestampMs));
    json.setObjectProperty("failed", utils::JsonValue(result.failed));
    if (result.failed) {
        json.setObjectProperty("errorCode", utils::JsonValue(result.errorCode));
        json.setObjectProperty("errorMessage", utils::JsonValue(result.errorMessage));
    }

    std::string body = utils::JsonParser::stringify(json);

    BrokerMessage message;
    message.topic = topic;
    message.key = result.sessionId;
    message.headers[headers::SESSION_ID] = result.sessionId;
    message.headers[headers::SEQUENCE] = std::to_string(result.sequence);
    message.headers[headers::ATTEMPT_ID] = result.attemptId;
    message.headers[headers::IS_FINAL] = result.isFinal ? "1" : "0";
    message.payload.assign(body.begin(), body.end());
    return message;
}

stt::TranscriptionResult decodeResult(const BrokerMessage& message) {
    std::string body(message.payload.begin(), message.payload.end());
    utils::JsonValue json = utils::JsonParser::parse(body);
    if (!json.isObject() || !json.getProperty("sessionId").isString() ||
        !json.getProperty("sequence").isNumber()) {
        throw std::invalid_argument("malformed result envelope");
    }

    stt::TranscriptionResult result;
    result.sessionId = json.getString("sessionId");
    result.sequence = static_cast<uint64_t>(json.getNumber("sequence"));
    result.text = json.getString("text");
    result.confidence = static_cast<float>(json.getNumber("confidence"));
    result.isFinal = json.getBool("isFinal", true);
    result.provider = json.getString("provider");
    result.latency = std::chrono::milliseconds(static_cast<int64_t>(json.getNumber("latencyMs")));
    result.attemptId = json.getString("attemptId");
    result.timestampMs = static_cast<int64_t>(json.getNumber("timestamp"));
    result.failed = json.getBool("failed");
    result.errorCode = json.getString("errorCode");
    result.errorMessage = json.getString("errorMessage");
    return result;
}

} // namespace queue
} // namespace voicebridge
