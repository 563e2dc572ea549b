#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace voicebridge {
namespace audio {

// Audio format of a session's inbound stream
struct AudioFormat {
    std::string codec;      // "pcm_s16le"
    uint32_t sampleRate;    // 16000 Hz
    uint16_t channels;      // 1 (mono)
    uint16_t bitsPerSample; // 16

    AudioFormat() : codec("pcm_s16le"), sampleRate(16000), channels(1), bitsPerSample(16) {}
    AudioFormat(std::string c, uint32_t rate, uint16_t ch, uint16_t bits)
        : codec(std::move(c)), sampleRate(rate), channels(ch), bitsPerSample(bits) {}

    bool isValid() const {
        return sampleRate > 0 && channels > 0 && bitsPerSample > 0 && bitsPerSample % 8 == 0;
    }

    size_t getBytesPerSample() const {
        return bitsPerSample / 8;
    }

    size_t getFrameSizeBytes() const {
        return channels * getBytesPerSample();
    }

    size_t getBytesPerSecond() const {
        return sampleRate * getFrameSizeBytes();
    }

    // Byte length of a window of the given duration, rounded down to whole frames
    size_t bytesForDuration(std::chrono::milliseconds duration) const {
        size_t frames = static_cast<size_t>(sampleRate) * static_cast<size_t>(duration.count()) / 1000;
        return frames * getFrameSizeBytes();
    }

    std::string toString() const;
};

/**
 * A time windowed slice of one session's audio. Immutable once emitted.
 */
struct AudioSegment {
    std::string sessionId;
    uint64_t sequence;
    std::vector<uint8_t> payload;
    std::chrono::system_clock::time_point capturedAt;
    AudioFormat format;
    bool isFinalChunk;

    AudioSegment() : sequence(0), capturedAt(std::chrono::system_clock::now()), isFinalChunk(false) {}

    std::chrono::milliseconds getDuration() const {
        size_t bps = format.getBytesPerSecond();
        if (bps == 0) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::milliseconds(payload.size() * 1000 / bps);
    }

    // "<sessionId>:<sequence>"
    std::string key() const {
        return sessionId + ":" + std::to_string(sequence);
    }
};

} // namespace audio
} // namespace voicebridge
