#include <gtest/gtest.h>
#include "core/health_reporter.hpp"
#include "core/session_manager.hpp"
#include "queue/in_memory_broker.hpp"
#include "queue/queue_bridge.hpp"
#include "utils/json_utils.hpp"
#include "fake_providers.hpp"

using namespace voicebridge;
using namespace voicebridge::core;
using namespace fixtures;

class HealthReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.attemptsPerProvider = 1;
        options.providerTimeout = std::chrono::milliseconds(1000);
    }

    void TearDown() override {
        if (bridge) {
            bridge->stop();
        }
        if (sessions) {
            sessions->shutdown();
        }
        if (dispatcher) {
            dispatcher->stop();
        }
    }

    void build(std::vector<stt::ProviderPtr> providers) {
        dispatcher = std::make_shared<ProviderDispatcher>(std::move(providers), options);
        dispatcher->start();
        broadcaster = std::make_shared<ResultBroadcaster>(ResultBroadcaster::Options{});
        sessions = std::make_shared<SessionManager>(SessionManagerConfig{}, dispatcher, broadcaster,
                                                    std::make_shared<RateLimiter>(100.0, 100.0));
    }

    void runSegments(int count) {
        for (int i = 0; i < count; ++i) {
            dispatcher->dispatch(makeSegment("probe", static_cast<uint64_t>(i)));
        }
    }

    ProviderDispatcher::Options options;
    std::shared_ptr<ProviderDispatcher> dispatcher;
    std::shared_ptr<ResultBroadcaster> broadcaster;
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<queue::QueueBridge> bridge;
};

TEST_F(HealthReporterTest, HealthyWithWorkingProvider) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysText("x"))});
    sessions->openSession("a");
    sessions->openSession("b");
    runSegments(6);

    HealthReporter reporter(sessions, dispatcher, nullptr, HealthReporter::Options{});
    auto snapshot = reporter.snapshot();

    EXPECT_EQ(snapshot.status, HealthStatus::HEALTHY);
    EXPECT_EQ(snapshot.activeSessions, 2u);
    EXPECT_EQ(snapshot.queueMode, "disabled");
    ASSERT_EQ(snapshot.providers.size(), 1u);
    EXPECT_EQ(snapshot.providers[0].recentAttempts, 6u);
    EXPECT_EQ(HealthReporter::httpStatus(snapshot.status), 200);
}

TEST_F(HealthReporterTest, DegradedWhenOneProviderFails) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysFail()),
           std::make_shared<ScriptedProvider>("backup", ScriptedProvider::alwaysText("x"))});
    runSegments(5);

    HealthReporter reporter(sessions, dispatcher, nullptr, HealthReporter::Options{});
    auto snapshot = reporter.snapshot();
    EXPECT_EQ(snapshot.status, HealthStatus::DEGRADED);
    EXPECT_DOUBLE_EQ(snapshot.providers[0].recentErrorRate, 1.0);
}

TEST_F(HealthReporterTest, FewAttemptsAreNotJudged) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysFail())});
    runSegments(2);

    HealthReporter reporter(sessions, dispatcher, nullptr, HealthReporter::Options{});
    EXPECT_EQ(reporter.snapshot().status, HealthStatus::HEALTHY);
}

TEST_F(HealthReporterTest, UnhealthyWhenEveryProviderFails) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysFail()),
           std::make_shared<ScriptedProvider>("backup", ScriptedProvider::alwaysFail())});
    runSegments(5);

    HealthReporter reporter(sessions, dispatcher, nullptr, HealthReporter::Options{});
    auto snapshot = reporter.snapshot();
    EXPECT_EQ(snapshot.status, HealthStatus::UNHEALTHY);
    EXPECT_EQ(HealthReporter::httpStatus(snapshot.status), 503);
}

TEST_F(HealthReporterTest, UnhealthyWithoutProviders) {
    build({});
    HealthReporter reporter(sessions, dispatcher, nullptr, HealthReporter::Options{});
    EXPECT_EQ(reporter.snapshot().status, HealthStatus::UNHEALTHY);
}

TEST_F(HealthReporterTest, DegradedQueueIsReported) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysText("x"))});
    auto broker = std::make_shared<queue::InMemoryBroker>();
    broker->setAvailable(false);
    bridge = std::make_shared<queue::QueueBridge>(broker, dispatcher,
        [](const stt::TranscriptionResult&) {}, queue::QueueBridge::Options{});
    bridge->start();

    HealthReporter reporter(sessions, dispatcher, bridge, HealthReporter::Options{});
    auto snapshot = reporter.snapshot();
    EXPECT_EQ(snapshot.queueMode, "degraded");
    EXPECT_EQ(snapshot.status, HealthStatus::DEGRADED);
}

TEST_F(HealthReporterTest, JsonDocument) {
    build({std::make_shared<ScriptedProvider>("primary", ScriptedProvider::alwaysText("x"))});
    sessions->openSession("a");
    runSegments(1);

    HealthReporter reporter(sessions, dispatcher, nullptr, HealthReporter::Options{});
    auto json = utils::JsonParser::parse(HealthReporter::toJson(reporter.snapshot()));

    EXPECT_EQ(json.getString("status"), "healthy");
    EXPECT_EQ(json.getNumber("activeSessions"), 1);
    EXPECT_EQ(json.getString("queue"), "disabled");
    const auto& providers = json.getProperty("providers").asArray();
    ASSERT_EQ(providers.size(), 1u);
    EXPECT_EQ(providers[0].getString("name"), "primary");
    EXPECT_EQ(providers[0].getNumber("attempts"), 1);
}
