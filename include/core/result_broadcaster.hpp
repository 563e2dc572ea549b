#pragma once

#include "core/result_channel.hpp"
#include "stt/transcription_provider.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace voicebridge {
namespace core {

/**
 * Delivers transcription results to each session's channel in sequence order.
 *
 * Finals that arrive ahead of a gap wait in a bounded reorder buffer. A gap
 * older than the reorder timeout, or a buffer over its bound, is resolved by
 * flushing the buffer out of order; the skipped sequences may still be
 * delivered late. Interim results bypass the buffer.
 */
class ResultBroadcaster {
public:
    struct Options {
        size_t reorderBufferSize = 8;
        std::chrono::milliseconds reorderTimeout{2000};
    };

    struct Statistics {
        uint64_t emitted = 0;
        uint64_t discarded = 0;
        uint64_t duplicates = 0;
        uint64_t forcedFlushes = 0;
    };

    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ResultBroadcaster(Options options, Clock clock = nullptr);

    void registerSession(const std::string& sessionId, std::shared_ptr<ResultChannel> channel);

    /**
     * Returns true if the result was emitted or buffered, false if it was
     * discarded (unknown or closed session, stale interim, duplicate).
     */
    bool deliver(const stt::TranscriptionResult& result);

    // Flushes every session whose gap outlived the reorder timeout; returns the flush count
    size_t checkTimeouts();
    size_t checkTimeouts(std::chrono::steady_clock::time_point now);

    // Closes the channel; later results for the session are discarded
    void closeSession(const std::string& sessionId);

    bool hasSession(const std::string& sessionId) const;
    uint64_t getFinalizedCount(const std::string& sessionId) const;
    size_t getBufferedCount(const std::string& sessionId) const;
    uint64_t getNextExpected(const std::string& sessionId) const;
    std::shared_ptr<ResultChannel> getChannel(const std::string& sessionId) const;
    Statistics getStatistics() const;

private:
    struct SessionState {
        std::mutex mutex;
        std::shared_ptr<ResultChannel> channel;
        uint64_t nextExpected = 0;
        std::map<uint64_t, stt::TranscriptionResult> buffer;
        std::optional<std::chrono::steady_clock::time_point> gapStart;
        std::set<uint64_t> skipped;
        uint64_t finalized = 0;
    };

    std::shared_ptr<SessionState> find(const std::string& sessionId) const;
    bool emit(SessionState& state, const stt::TranscriptionResult& result);
    void emitFinal(SessionState& state, const stt::TranscriptionResult& result);
    // Flushes the whole buffer in ascending order; returns the sequences skipped
    // Emits everything buffered, plus the incoming result when given, in
    // sequence order. Returns the sequences passed over.
    std::set<uint64_t> forceFlush(SessionState& state, const stt::TranscriptionResult* incoming = nullptr);

    Options options_;
    Clock clock_;

    mutable std::mutex sessionsMutex_;
    std::map<std::string, std::shared_ptr<SessionState>> sessions_;

    std::atomic<uint64_t> emitted_{0};
    std::atomic<uint64_t> discarded_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> forcedFlushes_{0};
};

} // namespace core
} // namespace voicebridge
