#include "core/message_protocol.hpp"
#include "stt/transcription_provider.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace voicebridge {
namespace core {

namespace {

utils::JsonValue typedRoot(MessageType type) {
    utils::JsonValue root;
    root.setObject();
    root.setObjectProperty("type", utils::JsonValue(MessageProtocol::messageTypeToString(type)));
    return root;
}

int64_t orNow(int64_t timestamp) {
    return timestamp != 0 ? timestamp : stt::nowMillis();
}

} // namespace

std::string PingMessage::serialize() const {
    return utils::JsonParser::stringify(typedRoot(type_));
}

std::string EndSessionMessage::serialize() const {
    return utils::JsonParser::stringify(typedRoot(type_));
}

std::string GetStatusMessage::serialize() const {
    return utils::JsonParser::stringify(typedRoot(type_));
}

std::string TextSubscriptionMessage::serialize() const {
    return utils::JsonParser::stringify(typedRoot(type_));
}

std::string ConnectionEstablishedMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("sessionId", utils::JsonValue(sessionId_));
    root.setObjectProperty("timestamp", utils::JsonValue(orNow(timestamp_)));
    return utils::JsonParser::stringify(root);
}

std::string AudioReceivedMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("sessionId", utils::JsonValue(sessionId_));
    root.setObjectProperty("chunkSize", utils::JsonValue(static_cast<int64_t>(chunkSize_)));
    root.setObjectProperty("accepted", utils::JsonValue(accepted_));
    root.setObjectProperty("timestamp", utils::JsonValue(orNow(timestamp_)));
    return utils::JsonParser::stringify(root);
}

std::string TextSubscriptionAckMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("sessionId", utils::JsonValue(sessionId_));
    root.setObjectProperty("timestamp", utils::JsonValue(orNow(timestamp_)));
    return utils::JsonParser::stringify(root);
}

std::string TranscriptionMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("text", utils::JsonValue(text_));
    root.setObjectProperty("confidence", utils::JsonValue(confidence_));
    root.setObjectProperty("isFinal", utils::JsonValue(isFinal_));
    root.setObjectProperty("timestamp", utils::JsonValue(orNow(timestamp_)));
    root.setObjectProperty("sequence", utils::JsonValue(static_cast<int64_t>(sequence_)));
    root.setObjectProperty("provider", utils::JsonValue(provider_));
    root.setObjectProperty("sessionId", utils::JsonValue(sessionId_));
    return utils::JsonParser::stringify(root);
}

std::string ErrorMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("code", utils::JsonValue(code_));
    root.setObjectProperty("message", utils::JsonValue(message_));
    if (sequence_) {
        root.setObjectProperty("sequence", utils::JsonValue(static_cast<int64_t>(*sequence_)));
    }
    root.setObjectProperty("isFinal", utils::JsonValue(true));
    root.setObjectProperty("timestamp", utils::JsonValue(orNow(timestamp_)));
    return utils::JsonParser::stringify(root);
}

std::string StatusMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("data", data_);
    return utils::JsonParser::stringify(root);
}

std::string PongMessage::serialize() const {
    utils::JsonValue root = typedRoot(type_);
    root.setObjectProperty("timestamp", utils::JsonValue(orNow(timestamp_)));
    return utils::JsonParser::stringify(root);
}

std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& json) {
    try {
        utils::JsonValue root = utils::JsonParser::parse(json);

        if (!root.isObject() || !root.getProperty("type").isString()) {
            utils::Logger::warn("Invalid message format: missing type field");
            return nullptr;
        }

        switch (stringToMessageType(root.getProperty("type").asString())) {
            case MessageType::PING:
                return std::make_unique<PingMessage>();
            case MessageType::END_SESSION:
                return std::make_unique<EndSessionMessage>();
            case MessageType::GET_STATUS:
                return std::make_unique<GetStatusMessage>();
            case MessageType::SUBSCRIBE_TEXT:
                return std::make_unique<TextSubscriptionMessage>(true);
            case MessageType::UNSUBSCRIBE_TEXT:
                return std::make_unique<TextSubscriptionMessage>(false);
            default:
                utils::Logger::warn("Unsupported client message type: " + root.getProperty("type").asString());
                return nullptr;
        }
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to parse message: " + std::string(e.what()));
        return nullptr;
    }
}

MessageType MessageProtocol::getMessageType(const std::string& json) {
    try {
        utils::JsonValue root = utils::JsonParser::parse(json);
        if (!root.isObject() || !root.getProperty("type").isString()) {
            return MessageType::UNKNOWN;
        }
        return stringToMessageType(root.getProperty("type").asString());
    } catch (const std::exception& e) {
        utils::Logger::debug("Failed to get message type: " + std::string(e.what()));
        return MessageType::UNKNOWN;
    }
}

bool MessageProtocol::validateMessage(const std::string& json) {
    switch (getMessageType(json)) {
        case MessageType::PING:
        case MessageType::END_SESSION:
        case MessageType::GET_STATUS:
        case MessageType::SUBSCRIBE_TEXT:
        case MessageType::UNSUBSCRIBE_TEXT:
            return true;
        default:
            return false;
    }
}

std::string MessageProtocol::serializeOutbound(const OutboundMessage& message) {
    switch (message.type) {
        case OutboundType::TRANSCRIPTION:
            return TranscriptionMessage(message.sessionId, message.sequence, message.text,
                                        static_cast<double>(message.confidence), message.isFinal,
                                        message.provider, message.timestampMs).serialize();
        case OutboundType::ERROR:
            return ErrorMessage(message.errorCode, message.message, message.sequence,
                                message.timestampMs).serialize();
        case OutboundType::STATUS:
            return StatusMessage(message.data).serialize();
        case OutboundType::PONG:
            return PongMessage(message.timestampMs).serialize();
    }
    return ErrorMessage(utils::error_codes::INVALID_MESSAGE, "unknown outbound message").serialize();
}

bool MessageProtocol::shouldDeliver(const OutboundMessage& message, bool textSubscribed) {
    return textSubscribed || message.type != OutboundType::TRANSCRIPTION;
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "ping") return MessageType::PING;
    if (typeStr == "end_session") return MessageType::END_SESSION;
    if (typeStr == "get_status") return MessageType::GET_STATUS;
    if (typeStr == "subscribe_text") return MessageType::SUBSCRIBE_TEXT;
    if (typeStr == "unsubscribe_text") return MessageType::UNSUBSCRIBE_TEXT;
    if (typeStr == "connection_established") return MessageType::CONNECTION_ESTABLISHED;
    if (typeStr == "audio_received") return MessageType::AUDIO_RECEIVED;
    if (typeStr == "text_subscribed") return MessageType::TEXT_SUBSCRIBED;
    if (typeStr == "text_unsubscribed") return MessageType::TEXT_UNSUBSCRIBED;
    if (typeStr == "transcription") return MessageType::TRANSCRIPTION;
    if (typeStr == "error") return MessageType::ERROR;
    if (typeStr == "status") return MessageType::STATUS;
    if (typeStr == "pong") return MessageType::PONG;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::PING: return "ping";
        case MessageType::END_SESSION: return "end_session";
        case MessageType::GET_STATUS: return "get_status";
        case MessageType::SUBSCRIBE_TEXT: return "subscribe_text";
        case MessageType::UNSUBSCRIBE_TEXT: return "unsubscribe_text";
        case MessageType::CONNECTION_ESTABLISHED: return "connection_established";
        case MessageType::AUDIO_RECEIVED: return "audio_received";
        case MessageType::TEXT_SUBSCRIBED: return "text_subscribed";
        case MessageType::TEXT_UNSUBSCRIBED: return "text_unsubscribed";
        case MessageType::TRANSCRIPTION: return "transcription";
        case MessageType::ERROR: return "error";
        case MessageType::STATUS: return "status";
        case MessageType::PONG: return "pong";
        default: return "unknown";
    }
}

} // namespace core
} // namespace voicebridge
