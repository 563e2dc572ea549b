#include "core/session_manager.hpp"
#include "queue/queue_bridge.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <random>
#include <sstream>

namespace voicebridge {
namespace core {

namespace {

constexpr auto kLimiterPurgeInterval = std::chrono::seconds(60);
constexpr auto kLimiterIdleAge = std::chrono::minutes(5);

} // namespace

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::ACTIVE: return "active";
        case SessionState::DRAINING: return "draining";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

SessionManager::SessionManager(SessionManagerConfig config,
                               std::shared_ptr<ProviderDispatcher> dispatcher,
                               std::shared_ptr<ResultBroadcaster> broadcaster,
                               std::shared_ptr<RateLimiter> admissionLimiter,
                               std::shared_ptr<RateLimiter> ingestLimiter,
                               std::shared_ptr<queue::QueueBridge> bridge)
    : config_(std::move(config)), dispatcher_(std::move(dispatcher)),
      broadcaster_(std::move(broadcaster)), admissionLimiter_(std::move(admissionLimiter)),
      ingestLimiter_(std::move(ingestLimiter)), bridge_(std::move(bridge)),
      lastLimiterPurge_(std::chrono::steady_clock::now()) {
}

SessionManager::~SessionManager() {
    shutdown();
}

void SessionManager::start() {
    if (running_.exchange(true)) {
        return;
    }
    housekeeper_ = std::thread(&SessionManager::housekeepingLoop, this);
    utils::Logger::info("Session manager started (max " + std::to_string(config_.maxSessions) +
                        " sessions, " + std::to_string(config_.maxSessionsPerClient) + " per client)");
}

void SessionManager::shutdown() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(housekeepingMutex_);
        }
        housekeepingCondition_.notify_all();
        if (housekeeper_.joinable()) {
            housekeeper_.join();
        }
    }

    std::vector<std::shared_ptr<Session>> remaining;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& entry : sessions_) {
            remaining.push_back(entry.second);
        }
    }
    for (const auto& session : remaining) {
        finalize(session, "shutdown");
    }
    if (!remaining.empty()) {
        utils::Logger::info("Closed " + std::to_string(remaining.size()) + " sessions on shutdown");
    }
}

std::string SessionManager::openSession(const std::string& clientKey) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);

        if (sessions_.size() >= config_.maxSessions) {
            throw utils::CapacityExceededException(
                "Session capacity reached (" + std::to_string(config_.maxSessions) + ")", clientKey);
        }

        size_t perClient = 0;
        for (const auto& entry : sessions_) {
            if (entry.second->clientKey == clientKey) {
                perClient++;
            }
        }
        if (perClient >= config_.maxSessionsPerClient) {
            throw utils::CapacityExceededException(
                "Per-client session limit reached (" + std::to_string(config_.maxSessionsPerClient) + ")",
                clientKey);
        }

        // Last check: it consumes a token, so only admissions that pass the caps pay for it
        if (admissionLimiter_ && !admissionLimiter_->allow(clientKey)) {
            throw utils::CapacityExceededException("Session open rate exceeded", clientKey);
        }

        session = std::make_shared<Session>();
        session->id = generateSessionId();
        session->clientKey = clientKey;
        session->createdAtMs = stt::nowMillis();
        session->lastActivity = std::chrono::steady_clock::now();
        session->assembler = std::make_unique<audio::AudioChunkAssembler>(
            session->id, config_.audioFormat, config_.window);
        session->channel = std::make_shared<ResultChannel>(session->id, config_.outboundQueueCapacity);

        broadcaster_->registerSession(session->id, session->channel);
        sessions_[session->id] = session;
    }

    utils::Logger::info("Opened session " + session->id + " for client " + clientKey);
    return session->id;
}

bool SessionManager::ingest(const std::string& sessionId, const uint8_t* data, size_t size) {
    auto session = find(sessionId);
    if (!session) {
        throw utils::UnknownSessionException(sessionId);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->state != SessionState::ACTIVE) {
        throw utils::UnknownSessionException(sessionId);
    }

    if (ingestLimiter_ && !ingestLimiter_->allow(session->clientKey)) {
        utils::Logger::debug("Throttled audio frame for session " + sessionId);
        return false;
    }

    session->lastActivity = std::chrono::steady_clock::now();
    auto segments = session->assembler->feed(data, size);
    for (auto& segment : segments) {
        session->segmentsIssued++;
        route(std::move(segment));
    }
    return true;
}

void SessionManager::closeSession(const std::string& sessionId) {
    auto session = find(sessionId);
    if (!session) {
        throw utils::UnknownSessionException(sessionId);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->state == SessionState::ACTIVE) {
        beginDrain(*session);
        utils::Logger::info("Session " + sessionId + " draining (" +
                            std::to_string(session->segmentsIssued) + " segments issued)");
    }
}

SessionState SessionManager::getSessionState(const std::string& sessionId) const {
    auto session = find(sessionId);
    if (session) {
        std::lock_guard<std::mutex> lock(session->mutex);
        return session->state;
    }
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    if (closedIds_.count(sessionId) > 0) {
        return SessionState::CLOSED;
    }
    throw utils::UnknownSessionException(sessionId);
}

SessionInfo SessionManager::getSessionInfo(const std::string& sessionId) const {
    auto session = find(sessionId);
    if (!session) {
        throw utils::UnknownSessionException(sessionId);
    }

    SessionInfo info;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto stats = session->assembler->getStatistics();
        info.sessionId = session->id;
        info.clientKey = session->clientKey;
        info.state = session->state;
        info.createdAtMs = session->createdAtMs;
        info.lastActivity = session->lastActivity;
        info.segmentsIssued = session->segmentsIssued;
        info.bytesReceived = stats.bytesReceived;
        info.pendingBytes = stats.pendingBytes;
    }
    info.resultsFinalized = broadcaster_->getFinalizedCount(sessionId);
    info.resultsBuffered = broadcaster_->getBufferedCount(sessionId);
    return info;
}

size_t SessionManager::getActiveSessionCount() const {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& entry : sessions_) {
            snapshot.push_back(entry.second);
        }
    }
    size_t active = 0;
    for (const auto& session : snapshot) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state == SessionState::ACTIVE) {
            active++;
        }
    }
    return active;
}

size_t SessionManager::getSessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

std::shared_ptr<ResultChannel> SessionManager::getChannel(const std::string& sessionId) const {
    auto session = find(sessionId);
    return session ? session->channel : nullptr;
}

void SessionManager::setClosedCallback(ClosedCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    closedCallback_ = std::move(callback);
}

void SessionManager::runHousekeeping() {
    broadcaster_->checkTimeouts();
    if (bridge_) {
        bridge_->maintain();
    }

    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& entry : sessions_) {
            snapshot.push_back(entry.second);
        }
    }

    auto now = std::chrono::steady_clock::now();
    for (const auto& session : snapshot) {
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            uint64_t finalized = broadcaster_->getFinalizedCount(session->id);

            // A delivered result counts as activity
            if (finalized != session->finalizedSeen) {
                session->finalizedSeen = finalized;
                session->lastActivity = now;
            }

            if (session->state == SessionState::ACTIVE &&
                now - session->lastActivity >= config_.idleTimeout) {
                utils::Logger::info("Session " + session->id + " idle, closing");
                beginDrain(*session);
            }

            if (session->state == SessionState::DRAINING) {
                if (finalized >= session->segmentsIssued &&
                    broadcaster_->getBufferedCount(session->id) == 0) {
                    reason = "drained";
                } else if (now - session->drainStartedAt >= config_.drainGrace) {
                    reason = "drain grace expired";
                    utils::Logger::warn("Session " + session->id + " closed with " +
                                        std::to_string(session->segmentsIssued - std::min(finalized, session->segmentsIssued)) +
                                        " segments unanswered");
                }
            }
        }
        if (!reason.empty()) {
            finalize(session, reason);
        }
    }

    if (admissionLimiter_ && now - lastLimiterPurge_ >= kLimiterPurgeInterval) {
        lastLimiterPurge_ = now;
        admissionLimiter_->purgeIdle(kLimiterIdleAge);
        if (ingestLimiter_) {
            ingestLimiter_->purgeIdle(kLimiterIdleAge);
        }
    }
}

std::shared_ptr<SessionManager::Session> SessionManager::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

std::string SessionManager::generateSessionId() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::ostringstream ss;
    ss << "sess_" << std::hex << (gen() & 0xffffffffffffULL) << "_" << ++sessionCounter_;
    return ss.str();
}

void SessionManager::route(audio::AudioSegment segment) {
    if (bridge_ && bridge_->getMode() != queue::BridgeMode::STOPPED) {
        bridge_->publish(std::move(segment));
        return;
    }

    std::string key = segment.key();
    auto broadcaster = broadcaster_;
    bool accepted = dispatcher_->submit(std::move(segment), [broadcaster](const stt::TranscriptionResult& result) {
        broadcaster->deliver(result);
    });
    if (!accepted) {
        utils::Logger::warn("Dispatcher refused segment " + key);
    }
}

void SessionManager::beginDrain(Session& session) {
    session.state = SessionState::DRAINING;
    session.drainStartedAt = std::chrono::steady_clock::now();
    auto remainder = session.assembler->flush();
    if (remainder) {
        session.segmentsIssued++;
        route(std::move(*remainder));
    }
}

void SessionManager::finalize(const std::shared_ptr<Session>& session, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state == SessionState::CLOSED) {
            return;
        }
        session->state = SessionState::CLOSED;
    }

    dispatcher_->cancelSession(session->id);
    broadcaster_->closeSession(session->id);

    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions_.erase(session->id);
        closedIds_.insert(session->id);
        closedOrder_.push_back(session->id);
        while (closedOrder_.size() > config_.closedHistorySize) {
            closedIds_.erase(closedOrder_.front());
            closedOrder_.pop_front();
        }
    }

    utils::Logger::info("Session " + session->id + " closed (" + reason + ")");

    ClosedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = closedCallback_;
    }
    if (callback) {
        try {
            callback(session->id, reason);
        } catch (const std::exception& e) {
            utils::Logger::error("Closed-session callback failed for " + session->id + ": " + e.what());
        }
    }
}

void SessionManager::housekeepingLoop() {
    while (running_) {
        try {
            runHousekeeping();
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "SessionManager housekeeping");
        }

        std::unique_lock<std::mutex> lock(housekeepingMutex_);
        housekeepingCondition_.wait_for(lock, config_.housekeepingInterval, [this] { return !running_; });
    }
}

} // namespace core
} // namespace voicebridge
