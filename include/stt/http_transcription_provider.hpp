#pragma once

#include "stt/transcription_provider.hpp"
#include <chrono>
#include <string>

namespace voicebridge {
namespace stt {

/**
 * Provider backed by an HTTP transcription server. The segment is wrapped
 * into a WAV file and uploaded as multipart form data.
 *
 * apiFormat "whisper.cpp" posts to <url>/inference, "openai" posts to
 * <url>/v1/audio/transcriptions with an optional bearer key.
 */
class HttpTranscriptionProvider : public TranscriptionProvider {
public:
    struct Options {
        std::string name;
        std::string url;
        std::string apiFormat = "whisper.cpp";
        std::string apiKey;
        std::string model = "whisper-1";
        std::string language = "en";
        float defaultConfidence = 0.9f;
        std::chrono::milliseconds requestTimeout{5000};
        std::chrono::milliseconds connectTimeout{2000};
    };

    explicit HttpTranscriptionProvider(Options options);

    ProviderResponse transcribe(const std::vector<uint8_t>& audio,
                                const audio::AudioFormat& format) override;

    std::string getName() const override { return options_.name; }

    std::string getEndpoint() const;

    /**
     * Turn a response body into a ProviderResponse. Exposed for tests.
     */
    ProviderResponse parseResponse(long httpStatus, const std::string& body) const;

private:
    Options options_;
};

} // namespace stt
} // namespace voicebridge
