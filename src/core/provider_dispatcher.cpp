#include "core/provider_dispatcher.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <future>

namespace voicebridge {
namespace core {

using stt::ProviderResponse;
using stt::TranscriptionResult;

std::string attemptOutcomeToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::SUCCESS: return "Success";
        case AttemptOutcome::TIMEOUT: return "Timeout";
        case AttemptOutcome::ERROR: return "Error";
        case AttemptOutcome::DISCARDED: return "Discarded";
    }
    return "Unknown";
}

ProviderDispatcher::ProviderDispatcher(std::vector<stt::ProviderPtr> providers, Options options)
    : providers_(std::move(providers)), options_(options), running_(false) {
    if (options_.attemptsPerProvider < 1) {
        options_.attemptsPerProvider = 1;
    }
    if (options_.maxInFlightPerSession == 0) {
        options_.maxInFlightPerSession = 1;
    }
    for (const auto& provider : providers_) {
        providerRecords_[provider->getName()];
    }
}

ProviderDispatcher::~ProviderDispatcher() {
    stop();
}

void ProviderDispatcher::start() {
    if (running_) {
        return;
    }
    workQueue_ = std::make_shared<TaskQueue>();
    workers_ = std::make_unique<ThreadPool>(options_.workerThreads, "dispatch");
    workers_->start(workQueue_);
    lanes_.clear();
    for (const auto& provider : providers_) {
        CallLane lane;
        lane.queue = std::make_shared<TaskQueue>();
        lane.pool = std::make_unique<ThreadPool>(options_.callThreads, "calls-" + provider->getName());
        lane.pool->start(lane.queue);
        lanes_.push_back(std::move(lane));
    }
    running_ = true;
    utils::Logger::info("Provider dispatcher started with " + std::to_string(providers_.size()) + " providers");
}

void ProviderDispatcher::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    // Dropping queued calls breaks their promises so waiting workers return
    for (auto& lane : lanes_) {
        lane.queue->shutdown();
        lane.queue->clear();
    }
    if (workers_) {
        workers_->stop();
    }
    for (auto& lane : lanes_) {
        lane.pool->stop();
    }
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions_.clear();
    }
    utils::Logger::info("Provider dispatcher stopped");
}

TranscriptionResult ProviderDispatcher::dispatch(const audio::AudioSegment& segment) {
    auto dispatchStart = std::chrono::steady_clock::now();
    auto payload = std::make_shared<const audio::AudioSegment>(segment);
    std::string lastError = "no providers configured";
    int attemptNumber = 0;

    for (size_t index = 0; index < providers_.size(); ++index) {
        const auto& provider = providers_[index];
        for (int retry = 0; retry < options_.attemptsPerProvider; ++retry) {
            if (isCancelled(segment.sessionId)) {
                return TranscriptionResult::failure(segment.sessionId, segment.sequence,
                                                    utils::error_codes::UNKNOWN_SESSION, "session cancelled");
            }

            ProviderAttempt attempt;
            attempt.sessionId = segment.sessionId;
            attempt.sequence = segment.sequence;
            attempt.provider = provider->getName();
            attempt.attemptNumber = ++attemptNumber;
            attempt.attemptId = segment.key() + ":" + std::to_string(attemptNumber);

            auto state = std::make_shared<CallState>();
            state->started = std::chrono::steady_clock::now();

            std::shared_ptr<TaskQueue> callQueue = index < lanes_.size() ? lanes_[index].queue : nullptr;
            if (!callQueue || callQueue->isShuttingDown()) {
                attempt.outcome = AttemptOutcome::ERROR;
                attempt.error = "dispatcher stopped";
                recordAttempt(attempt);
                return TranscriptionResult::failure(segment.sessionId, segment.sequence,
                                                    utils::error_codes::ALL_PROVIDERS_EXHAUSTED,
                                                    "dispatcher stopped");
            }

            auto future = callQueue->enqueueWithFuture(
                segment.isFinalChunk ? TaskPriority::HIGH : TaskPriority::NORMAL,
                [this, provider, payload, state, attempt]() {
                    ProviderResponse response;
                    if (state->claimed.load()) {
                        // Abandoned while queued; the timeout is already recorded
                        return ProviderResponse::failure("abandoned before start");
                    }
                    try {
                        response = provider->transcribe(payload->payload, payload->format);
                    } catch (const std::exception& e) {
                        response = ProviderResponse::failure(e.what());
                    }
                    if (state->claimed.exchange(true)) {
                        // The dispatcher gave up on this attempt
                        ProviderAttempt late = attempt;
                        late.outcome = AttemptOutcome::DISCARDED;
                        late.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - state->started);
                        late.error = response.ok() ? "late result discarded" : response.error;
                        recordAttempt(late);
                        utils::Logger::debug("Discarded late result of attempt " + late.attemptId);
                    }
                    return response;
                });

            bool ready = future.wait_for(options_.providerTimeout) == std::future_status::ready;
            if (!ready && !state->claimed.exchange(true)) {
                attempt.outcome = AttemptOutcome::TIMEOUT;
                attempt.latency = options_.providerTimeout;
                attempt.error = "timed out";
                recordAttempt(attempt);
                lastError = provider->getName() + " timed out";
                utils::ErrorHandler::getInstance().reportError(
                    utils::ProviderTimeoutException(provider->getName(), options_.providerTimeout),
                    attempt.attemptId, segment.sessionId);
                continue;
            }

            ProviderResponse response;
            try {
                response = future.get();
            } catch (const std::exception& e) {
                // Broken promise when the call queue shut down under us
                response = ProviderResponse::failure(e.what());
            }
            attempt.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - state->started);

            if (!response.ok()) {
                attempt.outcome = AttemptOutcome::ERROR;
                attempt.error = response.error;
                recordAttempt(attempt);
                lastError = provider->getName() + ": " + response.error;
                utils::ErrorHandler::getInstance().reportError(
                    utils::ProviderException(provider->getName(), response.error),
                    attempt.attemptId, segment.sessionId);
                continue;
            }

            attempt.outcome = AttemptOutcome::SUCCESS;
            recordAttempt(attempt);

            TranscriptionResult result;
            result.sessionId = segment.sessionId;
            result.sequence = segment.sequence;
            result.text = response.text;
            result.confidence = response.confidence;
            result.isFinal = true;
            result.provider = provider->getName();
            result.attemptId = attempt.attemptId;
            result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - dispatchStart);
            result.timestampMs = stt::nowMillis();
            return result;
        }
    }

    utils::ErrorHandler::getInstance().reportError(
        utils::AllProvidersExhaustedException(segment.sessionId, segment.sequence),
        lastError, segment.sessionId);

    auto result = TranscriptionResult::failure(segment.sessionId, segment.sequence,
                                               utils::error_codes::ALL_PROVIDERS_EXHAUSTED,
                                               "All providers failed: " + lastError);
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - dispatchStart);
    return result;
}

bool ProviderDispatcher::submit(audio::AudioSegment segment, ResultCallback callback) {
    if (!running_) {
        return false;
    }

    std::string sessionId = segment.sessionId;
    uint64_t sequence = segment.sequence;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto& queue = sessions_[sessionId];
        if (queue.cancelled) {
            return false;
        }
        if (queue.inFlight < options_.maxInFlightPerSession) {
            queue.inFlight++;
            if (runOnWorker(PendingSegment{std::move(segment), callback})) {
                return true;
            }
            queue.inFlight--;
            if (queue.inFlight == 0 && queue.pending.empty()) {
                sessions_.erase(sessionId);
            }
            return false;
        }
        if (queue.pending.size() < options_.maxPendingPerSession) {
            queue.pending.push_back(PendingSegment{std::move(segment), std::move(callback)});
            return true;
        }
    }

    // Over the pending bound: complete immediately so ordering can proceed
    utils::Logger::warn("Session " + sessionId + " overloaded, rejecting segment " + std::to_string(sequence));
    callback(TranscriptionResult::failure(sessionId, sequence, utils::error_codes::OVERLOADED,
                                          "too many segments awaiting transcription"));
    return true;
}

bool ProviderDispatcher::runOnWorker(PendingSegment work) {
    std::string sessionId = work.segment.sessionId;
    auto priority = work.segment.isFinalChunk ? TaskPriority::HIGH : TaskPriority::NORMAL;
    auto shared = std::make_shared<PendingSegment>(std::move(work));

    return workQueue_->enqueue([this, shared]() {
        const std::string& id = shared->segment.sessionId;
        if (!isCancelled(id)) {
            TranscriptionResult result = dispatch(shared->segment);
            if (!isCancelled(id)) {
                try {
                    shared->callback(result);
                } catch (const std::exception& e) {
                    utils::Logger::error("Result callback failed for " + shared->segment.key() + ": " + e.what());
                }
            }
        }
        completeSegment(id);
    }, priority, sessionId);
}

void ProviderDispatcher::completeSegment(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return;
    }
    auto& queue = it->second;
    if (queue.inFlight > 0) {
        queue.inFlight--;
    }

    while (!queue.cancelled && !queue.pending.empty() &&
           queue.inFlight < options_.maxInFlightPerSession) {
        PendingSegment next = std::move(queue.pending.front());
        queue.pending.pop_front();
        queue.inFlight++;
        if (!runOnWorker(std::move(next))) {
            queue.inFlight--;
            queue.pending.clear();
            break;
        }
    }

    if (queue.inFlight == 0 && queue.pending.empty()) {
        sessions_.erase(it);
    }
}

void ProviderDispatcher::cancelSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return;
    }
    auto& queue = it->second;
    queue.cancelled = true;
    size_t dropped = queue.pending.size();
    queue.pending.clear();

    if (workQueue_) {
        size_t queued = workQueue_->cancelTagged(sessionId);
        dropped += queued;
        queue.inFlight -= std::min(queue.inFlight, queued);
    }
    if (queue.inFlight == 0) {
        sessions_.erase(it);
    }
    utils::Logger::debug("Cancelled session " + sessionId + " in dispatcher, dropped " +
                         std::to_string(dropped) + " segments");
}

bool ProviderDispatcher::isCancelled(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() && it->second.cancelled;
}

size_t ProviderDispatcher::getInFlight(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second.inFlight : 0;
}

size_t ProviderDispatcher::getPending(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second.pending.size() : 0;
}

void ProviderDispatcher::recordAttempt(const ProviderAttempt& attempt) {
    std::lock_guard<std::mutex> lock(attemptsMutex_);
    attemptLog_.push_back(attempt);
    while (attemptLog_.size() > options_.attemptLogCapacity) {
        attemptLog_.pop_front();
    }

    // Late completions were already counted as timeouts
    if (attempt.outcome == AttemptOutcome::DISCARDED) {
        return;
    }
    auto& record = providerRecords_[attempt.provider];
    bool failed = attempt.outcome != AttemptOutcome::SUCCESS;
    record.totalAttempts++;
    if (failed) {
        record.totalFailures++;
    }
    record.recent.push_back(failed);
    while (record.recent.size() > options_.statsWindow) {
        record.recent.pop_front();
    }
}

std::vector<ProviderAttempt> ProviderDispatcher::getAttemptLog() const {
    std::lock_guard<std::mutex> lock(attemptsMutex_);
    return std::vector<ProviderAttempt>(attemptLog_.begin(), attemptLog_.end());
}

std::vector<ProviderAttempt> ProviderDispatcher::getAttempts(const std::string& sessionId, uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(attemptsMutex_);
    std::vector<ProviderAttempt> matches;
    for (const auto& attempt : attemptLog_) {
        if (attempt.sessionId == sessionId && attempt.sequence == sequence) {
            matches.push_back(attempt);
        }
    }
    return matches;
}

std::vector<ProviderStats> ProviderDispatcher::getProviderStats() const {
    std::lock_guard<std::mutex> lock(attemptsMutex_);
    std::vector<ProviderStats> stats;
    for (const auto& provider : providers_) {
        ProviderStats entry;
        entry.name = provider->getName();
        auto it = providerRecords_.find(entry.name);
        if (it != providerRecords_.end()) {
            const auto& record = it->second;
            entry.totalAttempts = record.totalAttempts;
            entry.totalFailures = record.totalFailures;
            entry.recentAttempts = record.recent.size();
            size_t failures = 0;
            for (bool failed : record.recent) {
                if (failed) failures++;
            }
            entry.recentErrorRate = record.recent.empty() ? 0.0
                : static_cast<double>(failures) / static_cast<double>(record.recent.size());
        }
        stats.push_back(entry);
    }
    return stats;
}

} // namespace core
} // namespace voicebridge
