#include <gtest/gtest.h>
#include "core/session_manager.hpp"
#include "utils/error_handler.hpp"
#include "fake_providers.hpp"
#include <mutex>

using namespace voicebridge;
using namespace voicebridge::core;
using namespace fixtures;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::ErrorHandler::getInstance().clearErrorHistory();
        config.maxSessions = 3;
        config.maxSessionsPerClient = 2;
        config.idleTimeout = std::chrono::milliseconds(60000);
        config.drainGrace = std::chrono::milliseconds(200);
        // 20 ms at 16 kHz mono 16-bit
        config.window = std::chrono::milliseconds(20);
        dispatchOptions.providerTimeout = std::chrono::milliseconds(2000);
        dispatchOptions.attemptsPerProvider = 1;
    }

    void TearDown() override {
        gate.open();
        if (sessions) {
            sessions->shutdown();
        }
        if (dispatcher) {
            dispatcher->stop();
        }
    }

    void build(stt::ProviderPtr provider, std::shared_ptr<RateLimiter> admission = nullptr,
               std::shared_ptr<RateLimiter> ingestLimiter = nullptr) {
        std::vector<stt::ProviderPtr> providers;
        if (provider) {
            providers.push_back(provider);
        }
        dispatcher = std::make_shared<ProviderDispatcher>(providers, dispatchOptions);
        dispatcher->start();
        broadcaster = std::make_shared<ResultBroadcaster>(ResultBroadcaster::Options{});
        if (!admission) {
            admission = std::make_shared<RateLimiter>(1000.0, 1000.0);
        }
        sessions = std::make_shared<SessionManager>(config, dispatcher, broadcaster, admission, ingestLimiter);
        sessions->setClosedCallback([this](const std::string& id, const std::string& reason) {
            std::lock_guard<std::mutex> lock(closedMutex);
            closed.emplace_back(id, reason);
        });
    }

    std::vector<uint8_t> windows(size_t count) {
        return std::vector<uint8_t>(640 * count, 0);
    }

    std::string closedReason(const std::string& id) {
        std::lock_guard<std::mutex> lock(closedMutex);
        for (const auto& entry : closed) {
            if (entry.first == id) {
                return entry.second;
            }
        }
        return "";
    }

    bool housekeepUntilClosed(const std::string& id, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        return eventually([&] {
            sessions->runHousekeeping();
            return !closedReason(id).empty();
        }, timeout);
    }

    SessionManagerConfig config;
    ProviderDispatcher::Options dispatchOptions;
    std::shared_ptr<ProviderDispatcher> dispatcher;
    std::shared_ptr<ResultBroadcaster> broadcaster;
    std::shared_ptr<SessionManager> sessions;
    Gate gate;

    std::mutex closedMutex;
    std::vector<std::pair<std::string, std::string>> closed;
};

TEST_F(SessionManagerTest, OpenSessionAssignsUniqueIds) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));

    auto first = sessions->openSession("client-a");
    auto second = sessions->openSession("client-b");

    EXPECT_NE(first, second);
    EXPECT_EQ(first.rfind("sess_", 0), 0u);
    EXPECT_EQ(sessions->getSessionState(first), SessionState::ACTIVE);
    EXPECT_EQ(sessions->getActiveSessionCount(), 2u);
    EXPECT_NE(sessions->getChannel(first), nullptr);
    EXPECT_TRUE(broadcaster->hasSession(first));
}

TEST_F(SessionManagerTest, GlobalCapacityIsAllOrNothing) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));
    sessions->openSession("a");
    sessions->openSession("b");
    sessions->openSession("c");

    EXPECT_THROW(sessions->openSession("d"), utils::CapacityExceededException);
    EXPECT_EQ(sessions->getSessionCount(), 3u);
}

TEST_F(SessionManagerTest, PerClientCap) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));
    sessions->openSession("a");
    sessions->openSession("a");

    try {
        sessions->openSession("a");
        FAIL() << "expected CapacityExceededException";
    } catch (const utils::CapacityExceededException& e) {
        EXPECT_EQ(e.getCode(), utils::error_codes::CAPACITY_EXCEEDED);
    }
    EXPECT_NO_THROW(sessions->openSession("b"));
}

TEST_F(SessionManagerTest, AdmissionRateLimit) {
    auto limiter = std::make_shared<RateLimiter>(0.001, 2.0);
    config.maxSessionsPerClient = 10;
    config.maxSessions = 10;
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")), limiter);

    sessions->openSession("a");
    sessions->openSession("a");
    EXPECT_THROW(sessions->openSession("a"), utils::CapacityExceededException);
    EXPECT_NO_THROW(sessions->openSession("b"));
    EXPECT_EQ(sessions->getSessionCount(), 3u);
}

TEST_F(SessionManagerTest, CapRefusalDoesNotSpendTokens) {
    auto limiter = std::make_shared<RateLimiter>(0.001, 3.0);
    config.maxSessionsPerClient = 1;
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")), limiter);

    sessions->openSession("a");
    EXPECT_THROW(sessions->openSession("a"), utils::CapacityExceededException);
    EXPECT_DOUBLE_EQ(limiter->getTokens("a"), 2.0);
}

TEST_F(SessionManagerTest, UnknownSessionOperationsThrow) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));

    EXPECT_THROW(sessions->ingest("sess_missing", windows(1)), utils::UnknownSessionException);
    EXPECT_THROW(sessions->closeSession("sess_missing"), utils::UnknownSessionException);
    EXPECT_THROW(sessions->getSessionState("sess_missing"), utils::UnknownSessionException);
    EXPECT_THROW(sessions->getSessionInfo("sess_missing"), utils::UnknownSessionException);
}

TEST_F(SessionManagerTest, IngestProducesOrderedResults) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("hello")));
    auto id = sessions->openSession("a");
    auto channel = sessions->getChannel(id);

    EXPECT_TRUE(sessions->ingest(id, windows(3)));
    ASSERT_TRUE(eventually([&] { return channel->size() == 3; }));

    auto messages = channel->drain();
    for (size_t i = 0; i < messages.size(); ++i) {
        EXPECT_EQ(messages[i].sequence, i);
        EXPECT_EQ(messages[i].text, "hello");
        EXPECT_TRUE(messages[i].isFinal);
    }

    auto info = sessions->getSessionInfo(id);
    EXPECT_EQ(info.segmentsIssued, 3u);
    EXPECT_EQ(info.resultsFinalized, 3u);
    EXPECT_EQ(info.bytesReceived, 1920u);
    EXPECT_EQ(info.clientKey, "a");
}

TEST_F(SessionManagerTest, CloseFlushesRemainderAndDrains) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::echoFirstByte()));
    auto id = sessions->openSession("a");
    auto channel = sessions->getChannel(id);

    sessions->ingest(id, windows(1));
    sessions->ingest(id, std::vector<uint8_t>(100, 0));
    sessions->closeSession(id);

    EXPECT_EQ(sessions->getSessionState(id), SessionState::DRAINING);
    EXPECT_THROW(sessions->ingest(id, windows(1)), utils::UnknownSessionException);
    // Idempotent
    EXPECT_NO_THROW(sessions->closeSession(id));

    ASSERT_TRUE(housekeepUntilClosed(id));
    EXPECT_EQ(closedReason(id), "drained");
    EXPECT_EQ(sessions->getSessionState(id), SessionState::CLOSED);
    EXPECT_TRUE(channel->isClosed());

    auto messages = channel->drain();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].sequence, 1u);
    EXPECT_EQ(sessions->getSessionCount(), 0u);
}

TEST_F(SessionManagerTest, CloseWithSegmentsInFlightEndsWithinGrace) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("late"), &gate));
    auto id = sessions->openSession("a");
    auto channel = sessions->getChannel(id);

    sessions->ingest(id, windows(2));
    ASSERT_TRUE(gate.waitForWaiters(2));

    auto started = std::chrono::steady_clock::now();
    sessions->closeSession(id);
    ASSERT_TRUE(housekeepUntilClosed(id));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(closedReason(id), "drain grace expired");
    EXPECT_GE(elapsed, config.drainGrace);
    EXPECT_LT(elapsed, config.drainGrace + std::chrono::seconds(1));

    // Results arriving after close are never written
    gate.open();
    ASSERT_TRUE(eventually([&] { return dispatcher->getInFlight(id) == 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(channel->size(), 0u);
    EXPECT_EQ(channel->getPushedCount(), 0u);
}

TEST_F(SessionManagerTest, IdleSessionIsClosed) {
    config.idleTimeout = std::chrono::milliseconds(50);
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));
    auto id = sessions->openSession("a");

    sessions->runHousekeeping();
    EXPECT_EQ(sessions->getSessionState(id), SessionState::ACTIVE);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    ASSERT_TRUE(housekeepUntilClosed(id));
    EXPECT_EQ(sessions->getSessionState(id), SessionState::CLOSED);
}

TEST_F(SessionManagerTest, IdleSessionWithUnansweredSegmentIsReaped) {
    config.idleTimeout = std::chrono::milliseconds(50);
    config.drainGrace = std::chrono::milliseconds(50);
    dispatchOptions.providerTimeout = std::chrono::milliseconds(10000);
    // The provider never answers, so the segment is never finalized
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x"), &gate));
    auto id = sessions->openSession("a");
    ASSERT_TRUE(sessions->ingest(id, windows(1)));
    ASSERT_TRUE(gate.waitForWaiters(1));

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    ASSERT_TRUE(housekeepUntilClosed(id));
    EXPECT_EQ(closedReason(id), "drain grace expired");
}

TEST_F(SessionManagerTest, IngestThrottle) {
    auto ingestLimiter = std::make_shared<RateLimiter>(0.001, 2.0);
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")), nullptr, ingestLimiter);
    auto id = sessions->openSession("a");

    EXPECT_TRUE(sessions->ingest(id, std::vector<uint8_t>(10, 0)));
    EXPECT_TRUE(sessions->ingest(id, std::vector<uint8_t>(10, 0)));
    EXPECT_FALSE(sessions->ingest(id, std::vector<uint8_t>(10, 0)));
    EXPECT_EQ(sessions->getSessionInfo(id).bytesReceived, 20u);
}

TEST_F(SessionManagerTest, ExhaustedSegmentReportsErrorAndSessionContinues) {
    build(std::make_shared<ScriptedProvider>("p", [](int call, const std::vector<uint8_t>&) {
        return call == 0 ? ProviderResponse::failure("boom") : ProviderResponse("fine", 0.9f);
    }));
    auto id = sessions->openSession("a");
    auto channel = sessions->getChannel(id);

    sessions->ingest(id, windows(1));
    ASSERT_TRUE(eventually([&] { return channel->size() == 1; }));
    sessions->ingest(id, windows(1));
    ASSERT_TRUE(eventually([&] { return channel->size() == 2; }));

    auto messages = channel->drain();
    EXPECT_EQ(messages[0].type, OutboundType::ERROR);
    EXPECT_EQ(messages[0].errorCode, utils::error_codes::ALL_PROVIDERS_EXHAUSTED);
    EXPECT_EQ(messages[1].type, OutboundType::TRANSCRIPTION);
    EXPECT_EQ(messages[1].text, "fine");
    EXPECT_EQ(sessions->getSessionState(id), SessionState::ACTIVE);
}

TEST_F(SessionManagerTest, ShutdownClosesEverySession) {
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));
    sessions->start();
    auto a = sessions->openSession("a");
    auto b = sessions->openSession("b");

    sessions->shutdown();

    EXPECT_EQ(sessions->getSessionCount(), 0u);
    EXPECT_EQ(closedReason(a), "shutdown");
    EXPECT_EQ(closedReason(b), "shutdown");
}

TEST_F(SessionManagerTest, BackgroundHousekeepingDrains) {
    config.housekeepingInterval = std::chrono::milliseconds(10);
    build(std::make_shared<ScriptedProvider>("p", ScriptedProvider::alwaysText("x")));
    sessions->start();
    auto id = sessions->openSession("a");
    sessions->ingest(id, windows(1));
    sessions->closeSession(id);

    ASSERT_TRUE(eventually([&] { return !closedReason(id).empty(); }));
    EXPECT_EQ(closedReason(id), "drained");
}
