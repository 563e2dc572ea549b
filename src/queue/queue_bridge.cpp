#include "queue/queue_bridge.hpp"
#include "queue/envelope.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace voicebridge {
namespace queue {

std::string bridgeModeToString(BridgeMode mode) {
    switch (mode) {
        case BridgeMode::CONNECTED: return "connected";
        case BridgeMode::DEGRADED: return "degraded";
        case BridgeMode::STOPPED: return "stopped";
    }
    return "unknown";
}

bool QueueBridge::DedupeWindow::insert(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!seen_.insert(key).second) {
        return false;
    }
    order_.push_back(key);
    while (order_.size() > capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

QueueBridge::QueueBridge(std::shared_ptr<MessageBroker> broker,
                         std::shared_ptr<core::ProviderDispatcher> dispatcher,
                         ResultSink sink, Options options)
    : broker_(std::move(broker)), dispatcher_(std::move(dispatcher)), sink_(std::move(sink)),
      options_(std::move(options)), mode_(BridgeMode::STOPPED),
      segmentsSeen_(options_.dedupeCapacity), resultsSeen_(options_.dedupeCapacity) {
    if (options_.workerCount == 0) {
        options_.workerCount = 1;
    }
}

QueueBridge::~QueueBridge() {
    stop();
}

void QueueBridge::start() {
    if (mode_ != BridgeMode::STOPPED) {
        return;
    }

    for (size_t i = 0; i < options_.workerCount; ++i) {
        broker_->subscribe(options_.segmentTopic, "dispatch-workers",
                           [this](const BrokerMessage& message) { handleSegment(message); });
    }
    broker_->subscribe(options_.resultTopic, "result-broadcaster",
                       [this](const BrokerMessage& message) { handleResult(message); });

    if (broker_->connect()) {
        mode_ = BridgeMode::CONNECTED;
        utils::Logger::info("Queue bridge connected, " + std::to_string(options_.workerCount) +
                            " dispatch workers on " + options_.segmentTopic);
    } else {
        mode_ = BridgeMode::CONNECTED;
        enterDegraded("initial connection failed");
    }
}

void QueueBridge::stop() {
    if (mode_.exchange(BridgeMode::STOPPED) == BridgeMode::STOPPED) {
        return;
    }
    broker_->close();
    utils::Logger::info("Queue bridge stopped");
}

void QueueBridge::publish(audio::AudioSegment segment) {
    BridgeMode mode = mode_;
    if (mode == BridgeMode::DEGRADED) {
        maintain();
        mode = mode_;
    }
    if (mode != BridgeMode::CONNECTED) {
        dispatchDirect(std::move(segment));
        return;
    }

    try {
        if (!broker_->isConnected()) {
            throw utils::QueueUnavailableException("broker disconnected");
        }
        broker_->publish(encodeSegment(options_.segmentTopic, segment, nextAttemptId(segment)));
        published_++;
    } catch (const utils::QueueUnavailableException& e) {
        enterDegraded(e.what());
        dispatchDirect(std::move(segment));
    }
}

void QueueBridge::maintain() {
    if (mode_ != BridgeMode::DEGRADED) {
        return;
    }
    std::lock_guard<std::mutex> lock(reconnectMutex_);
    auto now = std::chrono::steady_clock::now();
    if (now - lastReconnectAttempt_ < options_.reconnectInterval) {
        return;
    }
    lastReconnectAttempt_ = now;

    if (broker_->connect()) {
        BridgeMode expected = BridgeMode::DEGRADED;
        if (mode_.compare_exchange_strong(expected, BridgeMode::CONNECTED)) {
            reconnects_++;
            utils::Logger::info("Queue connection restored, resuming broker dispatch");
        }
    } else {
        utils::Logger::debug("Queue reconnect attempt failed");
    }
}

void QueueBridge::handleSegment(const BrokerMessage& message) {
    audio::AudioSegment segment;
    try {
        segment = decodeSegment(message);
    } catch (const std::invalid_argument& e) {
        // Malformed envelopes will never decode; do not ask for redelivery
        utils::ErrorInfo info(utils::ErrorCategory::QUEUE, utils::ErrorSeverity::ERROR,
                              "Dropping malformed segment envelope", e.what(), options_.segmentTopic);
        utils::ErrorHandler::getInstance().reportError(info);
        return;
    }

    std::string key = segment.key() + ":" + message.header(headers::ATTEMPT_ID);
    if (!segmentsSeen_.insert(key)) {
        duplicateSegments_++;
        utils::Logger::debug("Ignoring redelivered segment " + key);
        return;
    }

    forwardResult(dispatcher_->dispatch(segment));
}

void QueueBridge::handleResult(const BrokerMessage& message) {
    stt::TranscriptionResult result;
    try {
        result = decodeResult(message);
    } catch (const std::exception& e) {
        utils::ErrorInfo info(utils::ErrorCategory::QUEUE, utils::ErrorSeverity::ERROR,
                              "Dropping malformed result envelope", e.what(), options_.resultTopic);
        utils::ErrorHandler::getInstance().reportError(info);
        return;
    }

    std::string key = result.sessionId + ":" + std::to_string(result.sequence) + ":" +
                      result.attemptId + ":" + (result.isFinal ? "final" : "interim");
    if (!resultsSeen_.insert(key)) {
        duplicateResults_++;
        utils::Logger::debug("Ignoring redelivered result " + key);
        return;
    }

    resultsForwarded_++;
    sink_(result);
}

void QueueBridge::forwardResult(const stt::TranscriptionResult& result) {
    if (mode_ == BridgeMode::CONNECTED) {
        try {
            broker_->publish(encodeResult(options_.resultTopic, result));
            return;
        } catch (const utils::QueueUnavailableException& e) {
            enterDegraded(e.what());
        }
    }
    resultsForwarded_++;
    sink_(result);
}

void QueueBridge::dispatchDirect(audio::AudioSegment segment) {
    fallbacks_++;
    if (!dispatcher_->submit(std::move(segment), sink_)) {
        utils::Logger::debug("Direct dispatch refused a segment");
    }
}

void QueueBridge::enterDegraded(const std::string& reason) {
    BridgeMode expected = BridgeMode::CONNECTED;
    if (!mode_.compare_exchange_strong(expected, BridgeMode::DEGRADED)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reconnectMutex_);
        lastReconnectAttempt_ = std::chrono::steady_clock::now();
    }
    utils::ErrorHandler::getInstance().reportError(
        utils::QueueUnavailableException(reason + "; falling back to direct dispatch"));
}

std::string QueueBridge::nextAttemptId(const audio::AudioSegment& segment) {
    return segment.key() + ":q" + std::to_string(++attemptCounter_);
}

QueueBridge::Statistics QueueBridge::getStatistics() const {
    Statistics stats;
    stats.published = published_;
    stats.fallbacks = fallbacks_;
    stats.duplicateSegments = duplicateSegments_;
    stats.duplicateResults = duplicateResults_;
    stats.resultsForwarded = resultsForwarded_;
    stats.reconnects = reconnects_;
    return stats;
}

} // namespace queue
} // namespace voicebridge
