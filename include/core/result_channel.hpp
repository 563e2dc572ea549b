#pragma once

#include "utils/json_utils.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voicebridge {
namespace core {

enum class OutboundType {
    TRANSCRIPTION,
    ERROR,
    STATUS,
    PONG
};

// One message destined for a client connection
struct OutboundMessage {
    OutboundType type;
    std::string sessionId;
    uint64_t sequence;
    std::string text;
    float confidence;
    bool isFinal;
    std::string provider;
    std::string errorCode;
    std::string message;
    int64_t timestampMs;
    utils::JsonValue data;  // status payload

    OutboundMessage()
        : type(OutboundType::TRANSCRIPTION)
        , sequence(0)
        , confidence(0.0f)
        , isFinal(false)
        , timestampMs(0) {}
};

/**
 * Bounded per-session outbound queue between the broadcaster and the
 * connection that owns the socket. When full, the oldest interim result is
 * dropped. Final results and errors are never dropped: without an interim to
 * evict they are queued past capacity, while other messages are refused.
 */
class ResultChannel {
public:
    using Notifier = std::function<void()>;

    ResultChannel(std::string sessionId, size_t capacity = 256);

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    // Returns false once the channel is closed or when a non-final message is refused
    bool push(OutboundMessage message);

    std::optional<OutboundMessage> tryPop();
    std::vector<OutboundMessage> drain();
    std::optional<OutboundMessage> waitPop(std::chrono::milliseconds timeout);

    /**
     * Called after each successful push, outside the channel lock.
     * Used to wake the event loop that owns the socket.
     */
    void setNotifier(Notifier notifier);

    void close();
    bool isClosed() const;

    const std::string& getSessionId() const { return sessionId_; }
    size_t size() const;
    uint64_t getPushedCount() const;
    uint64_t getDroppedCount() const;
    uint64_t getOverflowCount() const;

private:
    static bool isEvictable(const OutboundMessage& message);

    std::string sessionId_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<OutboundMessage> queue_;
    Notifier notifier_;
    bool closed_ = false;
    uint64_t pushed_ = 0;
    uint64_t dropped_ = 0;
    uint64_t overflowed_ = 0;
};

} // namespace core
} // namespace voicebridge
