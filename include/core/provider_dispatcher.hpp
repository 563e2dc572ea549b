#pragma once

#include "audio/audio_segment.hpp"
#include "core/task_queue.hpp"
#include "stt/transcription_provider.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voicebridge {
namespace core {

enum class AttemptOutcome {
    SUCCESS,
    TIMEOUT,
    ERROR,
    DISCARDED   // completed after its attempt was abandoned
};

std::string attemptOutcomeToString(AttemptOutcome outcome);

// One provider call for one segment
struct ProviderAttempt {
    std::string attemptId;   // "<session>:<sequence>:<n>"
    std::string sessionId;
    uint64_t sequence = 0;
    std::string provider;
    int attemptNumber = 0;
    AttemptOutcome outcome = AttemptOutcome::SUCCESS;
    std::chrono::milliseconds latency{0};
    std::string error;
};

struct ProviderStats {
    std::string name;
    uint64_t totalAttempts = 0;
    uint64_t totalFailures = 0;
    size_t recentAttempts = 0;
    double recentErrorRate = 0.0;
};

/**
 * Chooses providers for segments: ordered fallback, per-provider retry,
 * per-attempt timeout, and a per-session cap on concurrent dispatches.
 *
 * Provider calls run on their own pool so that a call exceeding the timeout
 * can be abandoned; its result is discarded when it eventually arrives.
 */
class ProviderDispatcher {
public:
    struct Options {
        std::chrono::milliseconds providerTimeout{5000};
        int attemptsPerProvider = 2;
        size_t maxInFlightPerSession = 2;
        size_t maxPendingPerSession = 64;
        size_t workerThreads = 4;
        size_t callThreads = 8;   // per provider
        size_t attemptLogCapacity = 1000;
        size_t statsWindow = 100;
    };

    using ResultCallback = std::function<void(const stt::TranscriptionResult&)>;

    ProviderDispatcher(std::vector<stt::ProviderPtr> providers, Options options);
    ~ProviderDispatcher();

    ProviderDispatcher(const ProviderDispatcher&) = delete;
    ProviderDispatcher& operator=(const ProviderDispatcher&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * Transcribe one segment, trying every provider in order. Never throws
     * for provider failures: exhaustion yields a failed final result with
     * code AllProvidersExhausted.
     */
    stt::TranscriptionResult dispatch(const audio::AudioSegment& segment);

    /**
     * Queue a segment for asynchronous dispatch. The callback runs exactly
     * once on a worker thread unless the session is cancelled first.
     * Returns false if the dispatcher is stopped or the session cancelled.
     */
    bool submit(audio::AudioSegment segment, ResultCallback callback);

    /**
     * Drop pending work of the session; results of its in-flight segments
     * are discarded when they arrive.
     */
    void cancelSession(const std::string& sessionId);

    size_t getInFlight(const std::string& sessionId) const;
    size_t getPending(const std::string& sessionId) const;

    std::vector<ProviderAttempt> getAttemptLog() const;
    std::vector<ProviderAttempt> getAttempts(const std::string& sessionId, uint64_t sequence) const;
    std::vector<ProviderStats> getProviderStats() const;
    size_t getProviderCount() const { return providers_.size(); }
    const Options& getOptions() const { return options_; }

private:
    struct PendingSegment {
        audio::AudioSegment segment;
        ResultCallback callback;
    };

    struct SessionQueue {
        size_t inFlight = 0;
        std::deque<PendingSegment> pending;
        bool cancelled = false;
    };

    struct ProviderRecord {
        uint64_t totalAttempts = 0;
        uint64_t totalFailures = 0;
        std::deque<bool> recent;  // true = failure
    };

    // Calls of one provider run on its own pool so a hung backend cannot
    // starve the providers after it
    struct CallLane {
        std::shared_ptr<TaskQueue> queue;
        std::unique_ptr<ThreadPool> pool;
    };

    // Shared between a provider call and the dispatcher waiting on it
    struct CallState {
        std::atomic<bool> claimed{false};
        std::chrono::steady_clock::time_point started;
    };

    bool runOnWorker(PendingSegment work);
    void completeSegment(const std::string& sessionId);
    void recordAttempt(const ProviderAttempt& attempt);
    bool isCancelled(const std::string& sessionId) const;

    std::vector<stt::ProviderPtr> providers_;
    Options options_;

    std::shared_ptr<TaskQueue> workQueue_;
    std::unique_ptr<ThreadPool> workers_;
    std::vector<CallLane> lanes_;
    std::atomic<bool> running_;

    mutable std::mutex sessionsMutex_;
    std::map<std::string, SessionQueue> sessions_;

    mutable std::mutex attemptsMutex_;
    std::deque<ProviderAttempt> attemptLog_;
    std::map<std::string, ProviderRecord> providerRecords_;
};

} // namespace core
} // namespace voicebridge
