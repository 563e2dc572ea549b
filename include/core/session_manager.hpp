#pragma once

#include "audio/audio_chunk_assembler.hpp"
#include "core/provider_dispatcher.hpp"
#include "core/rate_limiter.hpp"
#include "core/result_broadcaster.hpp"
#include "core/result_channel.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace voicebridge {
namespace queue {
class QueueBridge;
}

namespace core {

enum class SessionState {
    ACTIVE,
    DRAINING,
    CLOSED
};

std::string sessionStateToString(SessionState state);

struct SessionInfo {
    std::string sessionId;
    std::string clientKey;
    SessionState state = SessionState::ACTIVE;
    int64_t createdAtMs = 0;
    std::chrono::steady_clock::time_point lastActivity;
    uint64_t segmentsIssued = 0;
    uint64_t resultsFinalized = 0;
    size_t resultsBuffered = 0;
    uint64_t bytesReceived = 0;
    size_t pendingBytes = 0;
};

/**
 * Session manager configuration
 */
struct SessionManagerConfig {
    size_t maxSessions = 100;
    size_t maxSessionsPerClient = 5;
    std::chrono::milliseconds idleTimeout{60000};
    std::chrono::milliseconds drainGrace{5000};
    std::chrono::milliseconds housekeepingInterval{100};
    audio::AudioFormat audioFormat;
    std::chrono::milliseconds window{250};
    size_t outboundQueueCapacity = 256;
    size_t closedHistorySize = 1000;
};

/**
 * Owns the lifecycle of every live connection: admission, audio ingestion,
 * draining on close and release once results are delivered.
 *
 * State machine: Active -> Draining -> Closed. A housekeeping thread drives
 * reorder timeouts, drain completion and idle reaping.
 */
class SessionManager {
public:
    using ClosedCallback = std::function<void(const std::string& sessionId, const std::string& reason)>;

    SessionManager(SessionManagerConfig config,
                   std::shared_ptr<ProviderDispatcher> dispatcher,
                   std::shared_ptr<ResultBroadcaster> broadcaster,
                   std::shared_ptr<RateLimiter> admissionLimiter,
                   std::shared_ptr<RateLimiter> ingestLimiter = nullptr,
                   std::shared_ptr<queue::QueueBridge> bridge = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void start();

    // Closes every session immediately and stops housekeeping
    void shutdown();

    /**
     * Admit a new session. Throws CapacityExceededException when a cap or the
     * rate limiter refuses; a refused open leaves no state behind.
     */
    std::string openSession(const std::string& clientKey);

    /**
     * Feed audio to an Active session. Returns false when the frame was
     * throttled. Throws UnknownSessionException for unknown or closing sessions.
     */
    bool ingest(const std::string& sessionId, const uint8_t* data, size_t size);
    bool ingest(const std::string& sessionId, const std::vector<uint8_t>& data) {
        return ingest(sessionId, data.data(), data.size());
    }

    /**
     * Begin draining. Idempotent for sessions already draining; throws
     * UnknownSessionException for unknown ids.
     */
    void closeSession(const std::string& sessionId);

    SessionState getSessionState(const std::string& sessionId) const;
    SessionInfo getSessionInfo(const std::string& sessionId) const;
    size_t getActiveSessionCount() const;
    size_t getSessionCount() const;
    std::shared_ptr<ResultChannel> getChannel(const std::string& sessionId) const;

    void setClosedCallback(ClosedCallback callback);

    // One housekeeping pass; exposed so tests can drive it deterministically
    void runHousekeeping();

    const SessionManagerConfig& getConfig() const { return config_; }

private:
    struct Session {
        std::mutex mutex;
        std::string id;
        std::string clientKey;
        SessionState state = SessionState::ACTIVE;
        int64_t createdAtMs = 0;
        std::chrono::steady_clock::time_point lastActivity;
        std::chrono::steady_clock::time_point drainStartedAt;
        std::unique_ptr<audio::AudioChunkAssembler> assembler;
        std::shared_ptr<ResultChannel> channel;
        uint64_t segmentsIssued = 0;
        uint64_t finalizedSeen = 0;   // results delivered as of the last housekeeping pass
    };

    std::shared_ptr<Session> find(const std::string& sessionId) const;
    std::string generateSessionId();
    void route(audio::AudioSegment segment);
    void beginDrain(Session& session);
    void finalize(const std::shared_ptr<Session>& session, const std::string& reason);
    void housekeepingLoop();

    SessionManagerConfig config_;
    std::shared_ptr<ProviderDispatcher> dispatcher_;
    std::shared_ptr<ResultBroadcaster> broadcaster_;
    std::shared_ptr<RateLimiter> admissionLimiter_;
    std::shared_ptr<RateLimiter> ingestLimiter_;
    std::shared_ptr<queue::QueueBridge> bridge_;

    mutable std::mutex sessionsMutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::deque<std::string> closedOrder_;
    std::unordered_set<std::string> closedIds_;
    std::atomic<uint64_t> sessionCounter_{0};

    mutable std::mutex callbackMutex_;
    ClosedCallback closedCallback_;

    std::thread housekeeper_;
    std::mutex housekeepingMutex_;
    std::condition_variable housekeepingCondition_;
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point lastLimiterPurge_;
};

} // namespace core
} // namespace voicebridge
