#include "stt/transcription_provider.hpp"

namespace voicebridge {
namespace stt {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

TranscriptionResult TranscriptionResult::failure(const std::string& sessionId, uint64_t sequence,
                                                 const std::string& code, const std::string& message) {
    TranscriptionResult result;
    result.sessionId = sessionId;
    result.sequence = sequence;
    result.isFinal = true;
    result.failed = true;
    result.errorCode = code;
    result.errorMessage = message;
    result.timestampMs = nowMillis();
    return result;
}

} // namespace stt
} // namespace voicebridge
