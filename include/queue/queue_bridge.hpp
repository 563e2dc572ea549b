#pragma once

#include "core/provider_dispatcher.hpp"
#include "queue/message_broker.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace voicebridge {
namespace queue {

enum class BridgeMode {
    CONNECTED,
    DEGRADED,   // broker unreachable, segments go straight to the dispatcher
    STOPPED
};

std::string bridgeModeToString(BridgeMode mode);

/**
 * Routes segments through a durable broker so dispatch can scale out.
 *
 * Segments are published keyed by session id. Dispatch workers consume them,
 * transcribe synchronously and publish results, which a result consumer hands
 * to the result sink. Both consumers drop duplicates caused by redelivery.
 * When the broker is unreachable the bridge degrades to direct dispatch and
 * retries the connection every reconnectInterval.
 */
class QueueBridge {
public:
    struct Options {
        std::string segmentTopic = "audio.segments";
        std::string resultTopic = "transcription.results";
        size_t workerCount = 4;
        std::chrono::milliseconds reconnectInterval{10000};
        size_t dedupeCapacity = 10000;
    };

    struct Statistics {
        uint64_t published = 0;
        uint64_t fallbacks = 0;
        uint64_t duplicateSegments = 0;
        uint64_t duplicateResults = 0;
        uint64_t resultsForwarded = 0;
        uint64_t reconnects = 0;
    };

    using ResultSink = std::function<void(const stt::TranscriptionResult&)>;

    QueueBridge(std::shared_ptr<MessageBroker> broker,
                std::shared_ptr<core::ProviderDispatcher> dispatcher,
                ResultSink sink, Options options);
    ~QueueBridge();

    QueueBridge(const QueueBridge&) = delete;
    QueueBridge& operator=(const QueueBridge&) = delete;

    void start();

    // Stops consuming and closes the broker
    void stop();

    /**
     * Publish a segment with a fresh attempt id. Never throws for broker
     * failures: the segment is dispatched directly instead.
     */
    void publish(audio::AudioSegment segment);

    // Retries the broker connection when degraded and the interval has elapsed
    void maintain();

    BridgeMode getMode() const { return mode_; }
    Statistics getStatistics() const;

private:
    class DedupeWindow {
    public:
        explicit DedupeWindow(size_t capacity) : capacity_(capacity) {}
        // Returns false when the key was already seen
        bool insert(const std::string& key);

    private:
        size_t capacity_;
        std::mutex mutex_;
        std::deque<std::string> order_;
        std::unordered_set<std::string> seen_;
    };

    void handleSegment(const BrokerMessage& message);
    void handleResult(const BrokerMessage& message);
    void forwardResult(const stt::TranscriptionResult& result);
    void dispatchDirect(audio::AudioSegment segment);
    void enterDegraded(const std::string& reason);
    std::string nextAttemptId(const audio::AudioSegment& segment);

    std::shared_ptr<MessageBroker> broker_;
    std::shared_ptr<core::ProviderDispatcher> dispatcher_;
    ResultSink sink_;
    Options options_;

    std::atomic<BridgeMode> mode_;
    std::atomic<uint64_t> attemptCounter_{0};
    std::mutex reconnectMutex_;
    std::chrono::steady_clock::time_point lastReconnectAttempt_;

    DedupeWindow segmentsSeen_;
    DedupeWindow resultsSeen_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> duplicateSegments_{0};
    std::atomic<uint64_t> duplicateResults_{0};
    std::atomic<uint64_t> resultsForwarded_{0};
    std::atomic<uint64_t> reconnects_{0};
};

} // namespace queue
} // namespace voicebridge
