#pragma once

#include "core/provider_dispatcher.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace voicebridge {
namespace queue {
class QueueBridge;
}

namespace core {

class SessionManager;

enum class HealthStatus {
    HEALTHY,
    DEGRADED,
    UNHEALTHY
};

std::string healthStatusToString(HealthStatus status);

struct HealthSnapshot {
    HealthStatus status = HealthStatus::HEALTHY;
    size_t activeSessions = 0;
    size_t totalSessions = 0;
    std::vector<ProviderStats> providers;
    std::string queueMode = "disabled";
    int64_t uptimeSeconds = 0;
};

/**
 * Read-only status surface for the /health endpoint.
 *
 * Unhealthy when no provider is usable: none configured, or every provider
 * with enough recent attempts fails above the error-rate threshold.
 * Degraded when some provider is failing or the queue runs in fallback mode.
 */
class HealthReporter {
public:
    struct Options {
        double errorRateThreshold = 0.5;
        size_t minAttempts = 5;
    };

    HealthReporter(std::shared_ptr<SessionManager> sessions,
                   std::shared_ptr<ProviderDispatcher> dispatcher,
                   std::shared_ptr<queue::QueueBridge> bridge,
                   Options options);

    HealthSnapshot snapshot() const;

    static std::string toJson(const HealthSnapshot& snapshot);
    static int httpStatus(HealthStatus status) { return status == HealthStatus::UNHEALTHY ? 503 : 200; }

private:
    std::shared_ptr<SessionManager> sessions_;
    std::shared_ptr<ProviderDispatcher> dispatcher_;
    std::shared_ptr<queue::QueueBridge> bridge_;
    Options options_;
    std::chrono::steady_clock::time_point startedAt_;
};

} // namespace core
} // namespace voicebridge
