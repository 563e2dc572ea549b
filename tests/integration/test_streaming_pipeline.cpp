#include <gtest/gtest.h>
#include "core/session_manager.hpp"
#include "queue/in_memory_broker.hpp"
#include "queue/queue_bridge.hpp"
#include "fake_providers.hpp"
#include <map>
#include <mutex>

using namespace voicebridge;
using namespace voicebridge::core;
using namespace fixtures;
using ::testing::_;
using ::testing::Return;

namespace {

// 250 ms of 16 kHz mono 16-bit silence
std::vector<uint8_t> silenceWindow() {
    return std::vector<uint8_t>(8000, 0);
}

} // namespace

class StreamingPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatchOptions.attemptsPerProvider = 1;
        dispatchOptions.providerTimeout = std::chrono::milliseconds(2000);
        config.drainGrace = std::chrono::milliseconds(2000);
    }

    void TearDown() override {
        if (sessions) {
            sessions->shutdown();
        }
        if (bridge) {
            bridge->stop();
        }
        if (dispatcher) {
            dispatcher->stop();
        }
    }

    void build(std::vector<stt::ProviderPtr> providers, bool withQueue = false) {
        dispatcher = std::make_shared<ProviderDispatcher>(std::move(providers), dispatchOptions);
        dispatcher->start();
        broadcaster = std::make_shared<ResultBroadcaster>(ResultBroadcaster::Options{});
        if (withQueue) {
            broker = std::make_shared<queue::InMemoryBroker>(4, 2);
            queue::QueueBridge::Options options;
            options.workerCount = 2;
            options.reconnectInterval = std::chrono::milliseconds(50);
            auto target = broadcaster;
            bridge = std::make_shared<queue::QueueBridge>(broker, dispatcher,
                [target](const stt::TranscriptionResult& result) { target->deliver(result); }, options);
            bridge->start();
        }
        sessions = std::make_shared<SessionManager>(config, dispatcher, broadcaster,
                                                    std::make_shared<RateLimiter>(100.0, 100.0),
                                                    nullptr, bridge);
        sessions->start();
    }

    // Collect final transcription messages until count arrive or time runs out
    std::vector<OutboundMessage> collectFinals(const std::shared_ptr<ResultChannel>& channel, size_t count) {
        std::vector<OutboundMessage> finals;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (finals.size() < count && std::chrono::steady_clock::now() < deadline) {
            auto message = channel->waitPop(std::chrono::milliseconds(50));
            if (message && message->type == OutboundType::TRANSCRIPTION && message->isFinal) {
                finals.push_back(*message);
            }
        }
        return finals;
    }

    SessionManagerConfig config;
    ProviderDispatcher::Options dispatchOptions;
    std::shared_ptr<ProviderDispatcher> dispatcher;
    std::shared_ptr<ResultBroadcaster> broadcaster;
    std::shared_ptr<queue::InMemoryBroker> broker;
    std::shared_ptr<queue::QueueBridge> bridge;
    std::shared_ptr<SessionManager> sessions;
    std::mutex reasonsMutex;
    std::vector<std::string> reasons;
};

TEST_F(StreamingPipelineTest, ThreeWindowsYieldThreeOrderedFinals) {
    dispatchOptions.maxInFlightPerSession = 1;
    auto provider = std::make_shared<MockTranscriptionProvider>("mock");
    EXPECT_CALL(*provider, transcribe(_, _))
        .WillOnce(Return(ProviderResponse("a", 0.9f)))
        .WillOnce(Return(ProviderResponse("b", 0.9f)))
        .WillOnce(Return(ProviderResponse("c", 0.9f)));
    build({provider});

    auto id = sessions->openSession("client");
    auto channel = sessions->getChannel(id);
    ASSERT_NE(channel, nullptr);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
    }

    auto finals = collectFinals(channel, 3);
    ASSERT_EQ(finals.size(), 3u);
    EXPECT_EQ(finals[0].text, "a");
    EXPECT_EQ(finals[1].text, "b");
    EXPECT_EQ(finals[2].text, "c");
    for (size_t i = 0; i < finals.size(); ++i) {
        EXPECT_EQ(finals[i].sequence, i);
        EXPECT_EQ(finals[i].sessionId, id);
    }
    EXPECT_EQ(sessions->getSessionInfo(id).segmentsIssued, 3u);
}

TEST_F(StreamingPipelineTest, TimedOutPrimaryFallsBackOncePerSegment) {
    dispatchOptions.providerTimeout = std::chrono::milliseconds(100);
    auto primary = std::make_shared<ScriptedProvider>(
        "primary", ScriptedProvider::slow(std::chrono::milliseconds(400), "late"));
    auto secondary = std::make_shared<ScriptedProvider>("secondary", ScriptedProvider::echoFirstByte());
    build({primary, secondary});

    auto id = sessions->openSession("client");
    auto channel = sessions->getChannel(id);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
    }

    auto finals = collectFinals(channel, 3);
    ASSERT_EQ(finals.size(), 3u);
    for (uint64_t seq = 0; seq < 3; ++seq) {
        EXPECT_EQ(finals[seq].sequence, seq);
        EXPECT_EQ(finals[seq].provider, "secondary");

        auto attempts = dispatcher->getAttempts(id, seq);
        int primaryFailures = 0;
        for (const auto& attempt : attempts) {
            if (attempt.provider == "primary" && attempt.outcome == AttemptOutcome::TIMEOUT) {
                primaryFailures++;
            }
        }
        EXPECT_EQ(primaryFailures, 1) << "sequence " << seq;
    }
}

TEST_F(StreamingPipelineTest, CloseDrainsOutstandingResults) {
    build({std::make_shared<ScriptedProvider>("primary",
        ScriptedProvider::slow(std::chrono::milliseconds(50), "done"))});

    sessions->setClosedCallback([this](const std::string&, const std::string& reason) {
        std::lock_guard<std::mutex> lock(reasonsMutex);
        reasons.push_back(reason);
    });

    auto id = sessions->openSession("client");
    auto channel = sessions->getChannel(id);
    ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
    ASSERT_TRUE(sessions->ingest(id, std::vector<uint8_t>(1000, 0)));
    sessions->closeSession(id);

    auto finals = collectFinals(channel, 2);
    ASSERT_EQ(finals.size(), 2u);
    EXPECT_EQ(finals[1].sequence, 1u);
    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(reasonsMutex);
        return !reasons.empty();
    }));
    std::lock_guard<std::mutex> lock(reasonsMutex);
    EXPECT_EQ(reasons[0], "drained");
}

TEST_F(StreamingPipelineTest, QueuedPipelineDeliversInOrder) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysText("queued"))}, true);

    auto id = sessions->openSession("client");
    auto channel = sessions->getChannel(id);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
    }

    auto finals = collectFinals(channel, 4);
    ASSERT_EQ(finals.size(), 4u);
    for (uint64_t seq = 0; seq < 4; ++seq) {
        EXPECT_EQ(finals[seq].sequence, seq);
        EXPECT_EQ(finals[seq].text, "queued");
    }
    EXPECT_EQ(bridge->getMode(), queue::BridgeMode::CONNECTED);
    EXPECT_GE(bridge->getStatistics().published, 4u);
}

TEST_F(StreamingPipelineTest, QueueOutageFallsBackToDirectDispatch) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysText("direct"))}, true);
    broker->setAvailable(false);

    auto id = sessions->openSession("client");
    auto channel = sessions->getChannel(id);
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
    }

    auto finals = collectFinals(channel, 2);
    ASSERT_EQ(finals.size(), 2u);
    EXPECT_EQ(finals[0].sequence, 0u);
    EXPECT_EQ(finals[1].sequence, 1u);
    EXPECT_EQ(bridge->getMode(), queue::BridgeMode::DEGRADED);
}

TEST_F(StreamingPipelineTest, SessionsAreIsolated) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysText("x"))});

    std::map<std::string, std::shared_ptr<ResultChannel>> channels;
    for (int i = 0; i < 3; ++i) {
        auto id = sessions->openSession("client-" + std::to_string(i));
        channels[id] = sessions->getChannel(id);
        ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
        ASSERT_TRUE(sessions->ingest(id, silenceWindow()));
    }

    for (const auto& entry : channels) {
        auto finals = collectFinals(entry.second, 2);
        ASSERT_EQ(finals.size(), 2u);
        for (const auto& message : finals) {
            EXPECT_EQ(message.sessionId, entry.first);
        }
    }
}
