#pragma once

#include "audio/audio_segment.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace voicebridge {
namespace stt {

// What a backend returns for one call
struct ProviderResponse {
    std::string text;
    float confidence;
    std::string error;  // empty on success

    ProviderResponse() : confidence(0.0f) {}
    ProviderResponse(std::string t, float conf) : text(std::move(t)), confidence(conf) {}

    bool ok() const { return error.empty(); }

    static ProviderResponse failure(std::string message) {
        ProviderResponse response;
        response.error = std::move(message);
        return response;
    }
};

struct TranscriptionResult {
    std::string sessionId;
    uint64_t sequence;
    std::string text;
    float confidence;
    bool isFinal;
    std::string provider;
    std::chrono::milliseconds latency;
    std::string attemptId;
    int64_t timestampMs;

    // Failure marker; text is empty when set
    bool failed;
    std::string errorCode;
    std::string errorMessage;

    TranscriptionResult()
        : sequence(0)
        , confidence(0.0f)
        , isFinal(true)
        , latency(0)
        , timestampMs(0)
        , failed(false) {}

    static TranscriptionResult failure(const std::string& sessionId, uint64_t sequence,
                                       const std::string& code, const std::string& message);
};

// Milliseconds since the Unix epoch
int64_t nowMillis();

/**
 * Uniform capability interface over one speech recognition backend.
 * Implementations must be safe to call from several threads at once.
 */
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    /**
     * Transcribe one segment worth of audio. Backend failures are returned
     * through ProviderResponse::error; implementations may also throw.
     */
    virtual ProviderResponse transcribe(const std::vector<uint8_t>& audio,
                                        const audio::AudioFormat& format) = 0;

    virtual std::string getName() const = 0;
};

using ProviderPtr = std::shared_ptr<TranscriptionProvider>;

} // namespace stt
} // namespace voicebridge
