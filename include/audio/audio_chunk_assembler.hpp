#pragma once

#include "audio/audio_segment.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voicebridge {
namespace audio {

/**
 * Normalizes arbitrarily sized inbound fragments into fixed duration segments.
 *
 * Pending bytes never exceed one window: every full window buffered is emitted
 * immediately with the next sequence number. flush() emits the remainder as
 * the final chunk and seals the assembler.
 */
class AudioChunkAssembler {
public:
    struct Statistics {
        uint64_t bytesReceived = 0;
        uint64_t bytesRejected = 0;
        uint64_t segmentsEmitted = 0;
        size_t pendingBytes = 0;
    };

    AudioChunkAssembler(std::string sessionId, AudioFormat format,
                        std::chrono::milliseconds window = std::chrono::milliseconds(250));

    std::vector<AudioSegment> feed(const uint8_t* data, size_t size);
    std::vector<AudioSegment> feed(const std::vector<uint8_t>& data) {
        return feed(data.data(), data.size());
    }

    std::optional<AudioSegment> flush();

    bool isSealed() const;
    uint64_t getNextSequence() const;
    size_t getWindowBytes() const { return windowBytes_; }
    const AudioFormat& getFormat() const { return format_; }
    Statistics getStatistics() const;

private:
    AudioSegment makeSegment(std::vector<uint8_t> payload, bool finalChunk);

    std::string sessionId_;
    AudioFormat format_;
    size_t windowBytes_;

    mutable std::mutex mutex_;
    std::vector<uint8_t> pending_;
    uint64_t nextSequence_ = 0;
    bool sealed_ = false;
    Statistics stats_;
};

} // namespace audio
} // namespace voicebridge
