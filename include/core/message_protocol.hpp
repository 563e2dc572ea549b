#pragma once

#include "core/result_channel.hpp"
#include "utils/json_utils.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace voicebridge {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    PING,
    END_SESSION,
    GET_STATUS,
    SUBSCRIBE_TEXT,
    UNSUBSCRIBE_TEXT,
    // Server to Client
    CONNECTION_ESTABLISHED,
    AUDIO_RECEIVED,
    TEXT_SUBSCRIBED,
    TEXT_UNSUBSCRIBED,
    TRANSCRIPTION,
    ERROR,
    STATUS,
    PONG
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;

    MessageType getType() const { return type_; }
    virtual std::string serialize() const = 0;

protected:
    MessageType type_;
};

// Client to Server Messages
class PingMessage : public Message {
public:
    PingMessage() : Message(MessageType::PING) {}
    std::string serialize() const override;
};

class EndSessionMessage : public Message {
public:
    EndSessionMessage() : Message(MessageType::END_SESSION) {}
    std::string serialize() const override;
};

class GetStatusMessage : public Message {
public:
    GetStatusMessage() : Message(MessageType::GET_STATUS) {}
    std::string serialize() const override;
};

// Turns delivery of transcription messages on or off for the connection
class TextSubscriptionMessage : public Message {
public:
    explicit TextSubscriptionMessage(bool subscribe)
        : Message(subscribe ? MessageType::SUBSCRIBE_TEXT : MessageType::UNSUBSCRIBE_TEXT) {}
    bool isSubscribe() const { return type_ == MessageType::SUBSCRIBE_TEXT; }
    std::string serialize() const override;
};

// Server to Client Messages

// First frame on every connection; tells the client its session id
class ConnectionEstablishedMessage : public Message {
public:
    ConnectionEstablishedMessage(const std::string& sessionId, int64_t timestamp = 0)
        : Message(MessageType::CONNECTION_ESTABLISHED), sessionId_(sessionId), timestamp_(timestamp) {}
    const std::string& getSessionId() const { return sessionId_; }
    std::string serialize() const override;

private:
    std::string sessionId_;
    int64_t timestamp_;
};

class AudioReceivedMessage : public Message {
public:
    AudioReceivedMessage(const std::string& sessionId, size_t chunkSize, bool accepted, int64_t timestamp = 0)
        : Message(MessageType::AUDIO_RECEIVED), sessionId_(sessionId), chunkSize_(chunkSize),
          accepted_(accepted), timestamp_(timestamp) {}
    std::string serialize() const override;

private:
    std::string sessionId_;
    size_t chunkSize_;
    bool accepted_;
    int64_t timestamp_;
};

// Reply to subscribe_text / unsubscribe_text
class TextSubscriptionAckMessage : public Message {
public:
    TextSubscriptionAckMessage(const std::string& sessionId, bool subscribed, int64_t timestamp = 0)
        : Message(subscribed ? MessageType::TEXT_SUBSCRIBED : MessageType::TEXT_UNSUBSCRIBED),
          sessionId_(sessionId), timestamp_(timestamp) {}
    std::string serialize() const override;

private:
    std::string sessionId_;
    int64_t timestamp_;
};

class TranscriptionMessage : public Message {
public:
    TranscriptionMessage() : Message(MessageType::TRANSCRIPTION), confidence_(0.0), isFinal_(false), timestamp_(0), sequence_(0) {}
    TranscriptionMessage(const std::string& sessionId, uint64_t sequence, const std::string& text,
                         double confidence, bool isFinal, const std::string& provider, int64_t timestamp)
        : Message(MessageType::TRANSCRIPTION), sessionId_(sessionId), text_(text), confidence_(confidence),
          isFinal_(isFinal), provider_(provider), timestamp_(timestamp), sequence_(sequence) {}

    const std::string& getSessionId() const { return sessionId_; }
    const std::string& getText() const { return text_; }
    double getConfidence() const { return confidence_; }
    bool isFinal() const { return isFinal_; }
    const std::string& getProvider() const { return provider_; }
    int64_t getTimestamp() const { return timestamp_; }
    uint64_t getSequence() const { return sequence_; }

    std::string serialize() const override;

private:
    std::string sessionId_;
    std::string text_;
    double confidence_;
    bool isFinal_;
    std::string provider_;
    int64_t timestamp_;
    uint64_t sequence_;
};

class ErrorMessage : public Message {
public:
    ErrorMessage(const std::string& code, const std::string& message,
                 std::optional<uint64_t> sequence = std::nullopt, int64_t timestamp = 0)
        : Message(MessageType::ERROR), code_(code), message_(message), sequence_(sequence), timestamp_(timestamp) {}

    const std::string& getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    std::optional<uint64_t> getSequence() const { return sequence_; }

    std::string serialize() const override;

private:
    std::string code_;
    std::string message_;
    std::optional<uint64_t> sequence_;
    int64_t timestamp_;
};

class StatusMessage : public Message {
public:
    explicit StatusMessage(utils::JsonValue data) : Message(MessageType::STATUS), data_(std::move(data)) {}
    const utils::JsonValue& getData() const { return data_; }
    std::string serialize() const override;

private:
    utils::JsonValue data_;
};

class PongMessage : public Message {
public:
    explicit PongMessage(int64_t timestamp = 0) : Message(MessageType::PONG), timestamp_(timestamp) {}
    std::string serialize() const override;

private:
    int64_t timestamp_;
};

/**
 * JSON wire format for WebSocket text frames
 */
class MessageProtocol {
public:
    // Returns nullptr for malformed or unknown client messages
    static std::unique_ptr<Message> parseMessage(const std::string& json);

    static MessageType getMessageType(const std::string& json);
    static bool validateMessage(const std::string& json);

    // Wire form of a message queued on a session's result channel
    static std::string serializeOutbound(const OutboundMessage& message);

    // Transcriptions reach the client only while it is subscribed to text;
    // errors, status and pong are always delivered
    static bool shouldDeliver(const OutboundMessage& message, bool textSubscribed);

    static MessageType stringToMessageType(const std::string& typeStr);
    static std::string messageTypeToString(MessageType type);
};

} // namespace core
} // namespace voicebridge
