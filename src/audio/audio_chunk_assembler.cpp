#include "audio/audio_chunk_assembler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace voicebridge {
namespace audio {

std::string AudioFormat::toString() const {
    std::ostringstream oss;
    oss << codec << "/" << sampleRate << "Hz/" << channels << "ch/" << bitsPerSample << "bit";
    return oss.str();
}

AudioChunkAssembler::AudioChunkAssembler(std::string sessionId, AudioFormat format,
                                         std::chrono::milliseconds window)
    : sessionId_(std::move(sessionId)), format_(std::move(format)), windowBytes_(0) {
    if (!format_.isValid()) {
        throw std::invalid_argument("Invalid audio format: " + format_.toString());
    }
    windowBytes_ = format_.bytesForDuration(window);
    if (windowBytes_ == 0) {
        throw std::invalid_argument("Audio window shorter than one frame");
    }
    pending_.reserve(windowBytes_);
}

std::vector<AudioSegment> AudioChunkAssembler::feed(const uint8_t* data, size_t size) {
    std::vector<AudioSegment> segments;
    std::lock_guard<std::mutex> lock(mutex_);

    if (sealed_) {
        stats_.bytesRejected += size;
        utils::Logger::warn("Dropping " + std::to_string(size) + " bytes fed to sealed assembler of session " + sessionId_);
        return segments;
    }
    if (size == 0 || data == nullptr) {
        return segments;
    }

    stats_.bytesReceived += size;

    size_t offset = 0;
    while (offset < size) {
        size_t take = std::min(windowBytes_ - pending_.size(), size - offset);
        pending_.insert(pending_.end(), data + offset, data + offset + take);
        offset += take;

        if (pending_.size() == windowBytes_) {
            std::vector<uint8_t> window;
            window.swap(pending_);
            pending_.reserve(windowBytes_);
            segments.push_back(makeSegment(std::move(window), false));
        }
    }

    stats_.pendingBytes = pending_.size();
    return segments;
}

std::optional<AudioSegment> AudioChunkAssembler::flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (sealed_) {
        return std::nullopt;
    }
    sealed_ = true;

    if (pending_.empty()) {
        return std::nullopt;
    }

    std::vector<uint8_t> remainder;
    remainder.swap(pending_);
    stats_.pendingBytes = 0;
    return makeSegment(std::move(remainder), true);
}

bool AudioChunkAssembler::isSealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

uint64_t AudioChunkAssembler::getNextSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSequence_;
}

AudioChunkAssembler::Statistics AudioChunkAssembler::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

AudioSegment AudioChunkAssembler::makeSegment(std::vector<uint8_t> payload, bool finalChunk) {
    AudioSegment segment;
    segment.sessionId = sessionId_;
    segment.sequence = nextSequence_++;
    segment.payload = std::move(payload);
    segment.capturedAt = std::chrono::system_clock::now();
    segment.format = format_;
    segment.isFinalChunk = finalChunk;
    stats_.segmentsEmitted++;
    return segment;
}

} // namespace audio
} // namespace voicebridge
