#include <gtest/gtest.h>
#include "core/message_protocol.hpp"
#include "core/result_channel.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace voicebridge::core;
using voicebridge::utils::JsonParser;
using voicebridge::utils::JsonValue;

class MessageProtocolTest : public ::testing::Test {
protected:
    JsonValue roundTrip(const std::string& json) {
        return JsonParser::parse(json);
    }
};

TEST_F(MessageProtocolTest, ParsesClientMessages) {
    auto ping = MessageProtocol::parseMessage(R"({"type":"ping"})");
    ASSERT_NE(ping, nullptr);
    EXPECT_EQ(ping->getType(), MessageType::PING);

    auto end = MessageProtocol::parseMessage(R"({"type":"end_session","reason":"done"})");
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(end->getType(), MessageType::END_SESSION);

    auto status = MessageProtocol::parseMessage(R"({"type":"get_status"})");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->getType(), MessageType::GET_STATUS);
}

TEST_F(MessageProtocolTest, RejectsInvalidClientMessages) {
    EXPECT_EQ(MessageProtocol::parseMessage("not json"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"kind":"ping"})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":42})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"teleport"})"), nullptr);
    // Server-to-client types are not accepted from clients
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"transcription"})"), nullptr);

    EXPECT_FALSE(MessageProtocol::validateMessage(R"({"type":"pong"})"));
    EXPECT_TRUE(MessageProtocol::validateMessage(R"({"type":"ping"})"));
    EXPECT_EQ(MessageProtocol::getMessageType("[]"), MessageType::UNKNOWN);
}

TEST_F(MessageProtocolTest, TranscriptionWireFormat) {
    TranscriptionMessage message("sess_1", 4, "hello world", 0.75, true, "primary", 1700000000000);
    auto json = roundTrip(message.serialize());

    EXPECT_EQ(json.getString("type"), "transcription");
    EXPECT_EQ(json.getString("text"), "hello world");
    EXPECT_DOUBLE_EQ(json.getNumber("confidence"), 0.75);
    EXPECT_TRUE(json.getBool("isFinal"));
    EXPECT_EQ(json.getNumber("sequence"), 4);
    EXPECT_EQ(json.getString("provider"), "primary");
    EXPECT_EQ(json.getString("sessionId"), "sess_1");
    EXPECT_DOUBLE_EQ(json.getNumber("timestamp"), 1700000000000.0);
}

TEST_F(MessageProtocolTest, ErrorWireFormat) {
    ErrorMessage withSequence(voicebridge::utils::error_codes::ALL_PROVIDERS_EXHAUSTED, "no provider answered", 9);
    auto json = roundTrip(withSequence.serialize());
    EXPECT_EQ(json.getString("type"), "error");
    EXPECT_EQ(json.getString("code"), "AllProvidersExhausted");
    EXPECT_EQ(json.getString("message"), "no provider answered");
    EXPECT_EQ(json.getNumber("sequence"), 9);
    EXPECT_TRUE(json.getBool("isFinal"));
    EXPECT_GT(json.getNumber("timestamp"), 0);

    ErrorMessage withoutSequence("InvalidMessage", "bad frame");
    EXPECT_FALSE(roundTrip(withoutSequence.serialize()).hasProperty("sequence"));
}

TEST_F(MessageProtocolTest, StatusAndPong) {
    JsonValue data;
    data.setObject();
    data.setObjectProperty("state", JsonValue("active"));
    auto status = roundTrip(StatusMessage(data).serialize());
    EXPECT_EQ(status.getString("type"), "status");
    EXPECT_EQ(status.getProperty("data").getString("state"), "active");

    auto pong = roundTrip(PongMessage().serialize());
    EXPECT_EQ(pong.getString("type"), "pong");
    EXPECT_GT(pong.getNumber("timestamp"), 0);
}

TEST_F(MessageProtocolTest, SerializeOutboundByType) {
    OutboundMessage interim;
    interim.type = OutboundType::TRANSCRIPTION;
    interim.sessionId = "s";
    interim.sequence = 2;
    interim.text = "partial";
    interim.isFinal = false;
    auto json = roundTrip(MessageProtocol::serializeOutbound(interim));
    EXPECT_EQ(json.getString("type"), "transcription");
    EXPECT_FALSE(json.getBool("isFinal", true));

    OutboundMessage failure;
    failure.type = OutboundType::ERROR;
    failure.sequence = 3;
    failure.errorCode = "ProviderTimeout";
    failure.message = "slow";
    json = roundTrip(MessageProtocol::serializeOutbound(failure));
    EXPECT_EQ(json.getString("code"), "ProviderTimeout");
    EXPECT_EQ(json.getNumber("sequence"), 3);
}

TEST_F(MessageProtocolTest, ParsesTextSubscription) {
    auto subscribe = MessageProtocol::parseMessage(R"({"type":"subscribe_text"})");
    ASSERT_NE(subscribe, nullptr);
    EXPECT_EQ(subscribe->getType(), MessageType::SUBSCRIBE_TEXT);
    EXPECT_TRUE(static_cast<TextSubscriptionMessage&>(*subscribe).isSubscribe());

    auto unsubscribe = MessageProtocol::parseMessage(R"({"type":"unsubscribe_text"})");
    ASSERT_NE(unsubscribe, nullptr);
    EXPECT_EQ(unsubscribe->getType(), MessageType::UNSUBSCRIBE_TEXT);
    EXPECT_FALSE(static_cast<TextSubscriptionMessage&>(*unsubscribe).isSubscribe());

    EXPECT_TRUE(MessageProtocol::validateMessage(R"({"type":"unsubscribe_text"})"));
    // Acknowledgements only flow server to client
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"text_subscribed"})"), nullptr);
}

TEST_F(MessageProtocolTest, ConnectionEstablishedCarriesSessionId) {
    auto json = roundTrip(ConnectionEstablishedMessage("sess_42", 1700000000000).serialize());
    EXPECT_EQ(json.getString("type"), "connection_established");
    EXPECT_EQ(json.getString("sessionId"), "sess_42");
    EXPECT_DOUBLE_EQ(json.getNumber("timestamp"), 1700000000000.0);
}

TEST_F(MessageProtocolTest, AudioReceivedAcknowledgement) {
    auto json = roundTrip(AudioReceivedMessage("sess_1", 640, true).serialize());
    EXPECT_EQ(json.getString("type"), "audio_received");
    EXPECT_EQ(json.getString("sessionId"), "sess_1");
    EXPECT_EQ(json.getNumber("chunkSize"), 640);
    EXPECT_TRUE(json.getBool("accepted"));
    EXPECT_GT(json.getNumber("timestamp"), 0);

    auto throttled = roundTrip(AudioReceivedMessage("sess_1", 320, false).serialize());
    EXPECT_FALSE(throttled.getBool("accepted", true));
}

TEST_F(MessageProtocolTest, SubscriptionAcknowledgements) {
    auto subscribed = roundTrip(TextSubscriptionAckMessage("sess_1", true).serialize());
    EXPECT_EQ(subscribed.getString("type"), "text_subscribed");
    EXPECT_EQ(subscribed.getString("sessionId"), "sess_1");

    auto unsubscribed = roundTrip(TextSubscriptionAckMessage("sess_1", false).serialize());
    EXPECT_EQ(unsubscribed.getString("type"), "text_unsubscribed");
}

TEST_F(MessageProtocolTest, UnsubscribedConnectionsStillReceiveErrors) {
    OutboundMessage text;
    text.type = OutboundType::TRANSCRIPTION;
    text.isFinal = true;
    OutboundMessage failure;
    failure.type = OutboundType::ERROR;
    OutboundMessage pong;
    pong.type = OutboundType::PONG;

    EXPECT_TRUE(MessageProtocol::shouldDeliver(text, true));
    EXPECT_FALSE(MessageProtocol::shouldDeliver(text, false));
    EXPECT_TRUE(MessageProtocol::shouldDeliver(failure, false));
    EXPECT_TRUE(MessageProtocol::shouldDeliver(pong, false));
}

TEST_F(MessageProtocolTest, TypeNames) {
    for (auto type : {MessageType::PING, MessageType::END_SESSION, MessageType::GET_STATUS,
                      MessageType::SUBSCRIBE_TEXT, MessageType::UNSUBSCRIBE_TEXT,
                      MessageType::CONNECTION_ESTABLISHED, MessageType::AUDIO_RECEIVED,
                      MessageType::TEXT_SUBSCRIBED, MessageType::TEXT_UNSUBSCRIBED,
                      MessageType::TRANSCRIPTION, MessageType::ERROR, MessageType::STATUS, MessageType::PONG}) {
        EXPECT_EQ(MessageProtocol::stringToMessageType(MessageProtocol::messageTypeToString(type)), type);
    }
    EXPECT_EQ(MessageProtocol::messageTypeToString(MessageType::UNKNOWN), "unknown");
}

TEST(JsonUtilsTest, ParsesNestedDocuments) {
    auto root = JsonParser::parse(R"({"a": [1, 2.5, "x\n\u00e9"], "b": {"c": true, "d": null}})");
    ASSERT_TRUE(root.isObject());
    const auto& a = root.getProperty("a").asArray();
    ASSERT_EQ(a.size(), 3u);
    EXPECT_DOUBLE_EQ(a[1].asNumber(), 2.5);
    EXPECT_EQ(a[2].asString(), "x\n\xc3\xa9");
    EXPECT_TRUE(root.getProperty("b").getBool("c"));
    EXPECT_TRUE(root.getProperty("b").getProperty("d").isNull());
    EXPECT_TRUE(root.getProperty("missing").isNull());
}

TEST(JsonUtilsTest, TypedLookupsFallBack) {
    auto root = JsonParser::parse(R"({"n": 3, "s": "text"})");
    EXPECT_EQ(root.getString("n", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(root.getNumber("s", 7.0), 7.0);
    EXPECT_FALSE(root.getBool("absent"));
}

TEST(JsonUtilsTest, StringifyEscapes) {
    JsonValue root;
    root.setObject();
    root.setObjectProperty("quote", JsonValue("say \"hi\"\t"));
    auto reparsed = JsonParser::parse(JsonParser::stringify(root));
    EXPECT_EQ(reparsed.getString("quote"), "say \"hi\"\t");
}

TEST(JsonUtilsTest, MalformedInputThrows) {
    EXPECT_THROW(JsonParser::parse("{\"a\": }"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("[1, 2"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("{} trailing"), std::runtime_error);
}

class ResultChannelTest : public ::testing::Test {
protected:
    OutboundMessage transcription(uint64_t sequence, bool isFinal) {
        OutboundMessage message;
        message.type = OutboundType::TRANSCRIPTION;
        message.sessionId = "sess";
        message.sequence = sequence;
        message.isFinal = isFinal;
        return message;
    }
};

TEST_F(ResultChannelTest, FifoDelivery) {
    ResultChannel channel("sess", 8);
    channel.push(transcription(0, true));
    channel.push(transcription(1, true));

    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.tryPop()->sequence, 0u);
    EXPECT_EQ(channel.tryPop()->sequence, 1u);
    EXPECT_FALSE(channel.tryPop().has_value());
}

TEST_F(ResultChannelTest, OverflowDropsOldestInterimFirst) {
    ResultChannel channel("sess", 3);
    channel.push(transcription(0, true));
    channel.push(transcription(1, false));
    channel.push(transcription(2, true));
    EXPECT_TRUE(channel.push(transcription(3, true)));

    auto messages = channel.drain();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].sequence, 0u);
    EXPECT_EQ(messages[1].sequence, 2u);
    EXPECT_EQ(messages[2].sequence, 3u);
    EXPECT_EQ(channel.getDroppedCount(), 1u);
}

TEST_F(ResultChannelTest, FinalsSurviveOverflow) {
    ResultChannel channel("sess", 2);
    EXPECT_TRUE(channel.push(transcription(0, true)));
    EXPECT_TRUE(channel.push(transcription(1, true)));
    EXPECT_TRUE(channel.push(transcription(2, true)));

    OutboundMessage error;
    error.type = OutboundType::ERROR;
    error.sequence = 3;
    error.isFinal = true;
    EXPECT_TRUE(channel.push(error));

    // Interims are refused rather than displacing a final
    EXPECT_FALSE(channel.push(transcription(4, false)));

    auto messages = channel.drain();
    ASSERT_EQ(messages.size(), 4u);
    for (uint64_t seq = 0; seq < 4; ++seq) {
        EXPECT_EQ(messages[seq].sequence, seq);
    }
    EXPECT_EQ(messages[3].type, OutboundType::ERROR);
    EXPECT_EQ(channel.getOverflowCount(), 2u);
    EXPECT_EQ(channel.getDroppedCount(), 1u);
}

TEST_F(ResultChannelTest, ClosedChannelRejectsButKeepsQueued) {
    ResultChannel channel("sess");
    channel.push(transcription(0, true));
    channel.close();

    EXPECT_TRUE(channel.isClosed());
    EXPECT_FALSE(channel.push(transcription(1, true)));
    EXPECT_EQ(channel.drain().size(), 1u);
    EXPECT_EQ(channel.getPushedCount(), 1u);
}

TEST_F(ResultChannelTest, NotifierRunsOnPush) {
    ResultChannel channel("sess");
    std::atomic<int> notified{0};
    channel.setNotifier([&]() { notified++; });

    channel.push(transcription(0, true));
    channel.push(transcription(1, true));
    EXPECT_EQ(notified.load(), 2);

    channel.close();
    channel.push(transcription(2, true));
    EXPECT_EQ(notified.load(), 2);
}

TEST_F(ResultChannelTest, WaitPopWakesOnPush) {
    ResultChannel channel("sess");
    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push(transcription(5, true));
    });

    auto message = channel.waitPop(std::chrono::seconds(2));
    producer.join();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->sequence, 5u);

    EXPECT_FALSE(channel.waitPop(std::chrono::milliseconds(10)).has_value());
}
