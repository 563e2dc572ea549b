#include "core/health_reporter.hpp"
#include "core/session_manager.hpp"
#include "queue/queue_bridge.hpp"
#include "utils/json_utils.hpp"

namespace voicebridge {
namespace core {

std::string healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
    }
    return "unknown";
}

HealthReporter::HealthReporter(std::shared_ptr<SessionManager> sessions,
                               std::shared_ptr<ProviderDispatcher> dispatcher,
                               std::shared_ptr<queue::QueueBridge> bridge,
                               Options options)
    : sessions_(std::move(sessions)), dispatcher_(std::move(dispatcher)), bridge_(std::move(bridge)),
      options_(options), startedAt_(std::chrono::steady_clock::now()) {
}

HealthSnapshot HealthReporter::snapshot() const {
    HealthSnapshot snap;
    if (sessions_) {
        snap.activeSessions = sessions_->getActiveSessionCount();
        snap.totalSessions = sessions_->getSessionCount();
    }
    if (dispatcher_) {
        snap.providers = dispatcher_->getProviderStats();
    }
    if (bridge_) {
        snap.queueMode = queue::bridgeModeToString(bridge_->getMode());
    }
    snap.uptimeSeconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startedAt_).count();

    size_t failing = 0;
    for (const auto& provider : snap.providers) {
        if (provider.recentAttempts >= options_.minAttempts &&
            provider.recentErrorRate > options_.errorRateThreshold) {
            failing++;
        }
    }

    if (snap.providers.empty() || failing == snap.providers.size()) {
        snap.status = HealthStatus::UNHEALTHY;
    } else if (failing > 0 || snap.queueMode == "degraded") {
        snap.status = HealthStatus::DEGRADED;
    } else {
        snap.status = HealthStatus::HEALTHY;
    }
    return snap;
}

std::string HealthReporter::toJson(const HealthSnapshot& snapshot) {
    utils::JsonValue root;
    root.setObject();
    root.setObjectProperty("status", utils::JsonValue(healthStatusToString(snapshot.status)));
    root.setObjectProperty("activeSessions", utils::JsonValue(static_cast<int64_t>(snapshot.activeSessions)));
    root.setObjectProperty("totalSessions", utils::JsonValue(static_cast<int64_t>(snapshot.totalSessions)));
    root.setObjectProperty("queue", utils::JsonValue(snapshot.queueMode));
    root.setObjectProperty("uptimeSeconds", utils::JsonValue(snapshot.uptimeSeconds));

    utils::JsonValue providers;
    providers.setArray();
    for (const auto& stats : snapshot.providers) {
        utils::JsonValue entry;
        entry.setObject();
        entry.setObjectProperty("name", utils::JsonValue(stats.name));
        entry.setObjectProperty("attempts", utils::JsonValue(static_cast<int64_t>(stats.totalAttempts)));
        entry.setObjectProperty("failures", utils::JsonValue(static_cast<int64_t>(stats.totalFailures)));
        entry.setObjectProperty("recentAttempts", utils::JsonValue(static_cast<int64_t>(stats.recentAttempts)));
        entry.setObjectProperty("recentErrorRate", utils::JsonValue(stats.recentErrorRate));
        providers.addArrayElement(entry);
    }
    root.setObjectProperty("providers", providers);

    return utils::JsonParser::stringify(root);
}

} // namespace core
} // namespace voicebridge
