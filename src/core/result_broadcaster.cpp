#include "core/result_broadcaster.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <vector>

namespace voicebridge {
namespace core {

namespace {

std::string describeSkipped(const std::set<uint64_t>& skipped) {
    std::string text;
    for (uint64_t sequence : skipped) {
        if (!text.empty()) text += ",";
        text += std::to_string(sequence);
    }
    return text;
}

} // namespace

ResultBroadcaster::ResultBroadcaster(Options options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    if (options_.reorderBufferSize == 0) {
        options_.reorderBufferSize = 1;
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

void ResultBroadcaster::registerSession(const std::string& sessionId, std::shared_ptr<ResultChannel> channel) {
    auto state = std::make_shared<SessionState>();
    state->channel = std::move(channel);
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions_[sessionId] = state;
}

bool ResultBroadcaster::deliver(const stt::TranscriptionResult& result) {
    auto state = find(result.sessionId);
    if (!state) {
        discarded_++;
        utils::Logger::debug("Discarding result for inactive session " + result.sessionId +
                             " sequence " + std::to_string(result.sequence));
        return false;
    }

    std::set<uint64_t> skipped;
    bool accepted = true;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        const uint64_t sequence = result.sequence;

        if (!result.isFinal) {
            bool pending = sequence >= state->nextExpected
                ? state->buffer.count(sequence) == 0
                : state->skipped.count(sequence) > 0;
            if (!pending) {
                discarded_++;
                return false;
            }
            return emit(*state, result);
        }

        if (sequence == state->nextExpected) {
            emitFinal(*state, result);
            state->nextExpected++;
            while (!state->buffer.empty() && state->buffer.begin()->first == state->nextExpected) {
                emitFinal(*state, state->buffer.begin()->second);
                state->buffer.erase(state->buffer.begin());
                state->nextExpected++;
            }
            if (state->buffer.empty()) {
                state->gapStart.reset();
            } else {
                state->gapStart = clock_();
            }
        } else if (sequence > state->nextExpected) {
            if (state->buffer.count(sequence) > 0) {
                duplicates_++;
                accepted = false;
            } else if (state->buffer.size() >= options_.reorderBufferSize) {
                skipped = forceFlush(*state, &result);
                utils::Logger::warn("Reorder buffer overflow for session " + result.sessionId +
                                    ", flushed out of order");
            } else {
                state->buffer.emplace(sequence, result);
                if (!state->gapStart) {
                    state->gapStart = clock_();
                }
            }
        } else if (state->skipped.erase(sequence) > 0) {
            utils::Logger::debug("Late final for skipped sequence " + std::to_string(sequence) +
                                 " of session " + result.sessionId);
            emitFinal(*state, result);
        } else {
            duplicates_++;
            accepted = false;
        }
    }

    if (!skipped.empty()) {
        utils::ErrorInfo info(utils::ErrorCategory::ORDERING, utils::ErrorSeverity::WARNING,
                              "Reorder buffer overflow", "skipped sequences " + describeSkipped(skipped),
                              "ResultBroadcaster", result.sessionId);
        utils::ErrorHandler::getInstance().reportError(info);
    }
    return accepted;
}

size_t ResultBroadcaster::checkTimeouts() {
    return checkTimeouts(clock_());
}

size_t ResultBroadcaster::checkTimeouts(std::chrono::steady_clock::time_point now) {
    std::vector<std::pair<std::string, std::shared_ptr<SessionState>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        snapshot.assign(sessions_.begin(), sessions_.end());
    }

    size_t flushes = 0;
    for (const auto& entry : snapshot) {
        std::set<uint64_t> skipped;
        {
            std::lock_guard<std::mutex> lock(entry.second->mutex);
            auto& state = *entry.second;
            if (state.buffer.empty() || !state.gapStart || now - *state.gapStart < options_.reorderTimeout) {
                continue;
            }
            skipped = forceFlush(state);
        }
        flushes++;
        utils::ErrorInfo info(utils::ErrorCategory::ORDERING, utils::ErrorSeverity::WARNING,
                              "Reorder timeout", "skipped sequences " + describeSkipped(skipped),
                              "ResultBroadcaster", entry.first, utils::error_codes::REORDER_TIMEOUT);
        utils::ErrorHandler::getInstance().reportError(info);
    }
    return flushes;
}

void ResultBroadcaster::closeSession(const std::string& sessionId) {
    std::shared_ptr<SessionState> state;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return;
        }
        state = it->second;
        sessions_.erase(it);
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->buffer.empty()) {
        utils::Logger::debug("Closing session " + sessionId + " with " +
                             std::to_string(state->buffer.size()) + " buffered results");
    }
    state->buffer.clear();
    if (state->channel) {
        state->channel->close();
    }
}

bool ResultBroadcaster::hasSession(const std::string& sessionId) const {
    return find(sessionId) != nullptr;
}

uint64_t ResultBroadcaster::getFinalizedCount(const std::string& sessionId) const {
    auto state = find(sessionId);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->finalized;
}

size_t ResultBroadcaster::getBufferedCount(const std::string& sessionId) const {
    auto state = find(sessionId);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->buffer.size();
}

uint64_t ResultBroadcaster::getNextExpected(const std::string& sessionId) const {
    auto state = find(sessionId);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->nextExpected;
}

std::shared_ptr<ResultChannel> ResultBroadcaster::getChannel(const std::string& sessionId) const {
    auto state = find(sessionId);
    return state ? state->channel : nullptr;
}

ResultBroadcaster::Statistics ResultBroadcaster::getStatistics() const {
    Statistics stats;
    stats.emitted = emitted_;
    stats.discarded = discarded_;
    stats.duplicates = duplicates_;
    stats.forcedFlushes = forcedFlushes_;
    return stats;
}

std::shared_ptr<ResultBroadcaster::SessionState> ResultBroadcaster::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

bool ResultBroadcaster::emit(SessionState& state, const stt::TranscriptionResult& result) {
    OutboundMessage message;
    message.sessionId = result.sessionId;
    message.sequence = result.sequence;
    message.isFinal = result.isFinal;
    message.timestampMs = result.timestampMs != 0 ? result.timestampMs : stt::nowMillis();

    if (result.failed) {
        message.type = OutboundType::ERROR;
        message.errorCode = result.errorCode;
        message.message = result.errorMessage;
        message.isFinal = true;
    } else {
        message.type = OutboundType::TRANSCRIPTION;
        message.text = result.text;
        message.confidence = result.confidence;
        message.provider = result.provider;
    }

    if (!state.channel || !state.channel->push(std::move(message))) {
        discarded_++;
        return false;
    }
    emitted_++;
    return true;
}

void ResultBroadcaster::emitFinal(SessionState& state, const stt::TranscriptionResult& result) {
    state.finalized++;
    emit(state, result);
}

std::set<uint64_t> ResultBroadcaster::forceFlush(SessionState& state, const stt::TranscriptionResult* incoming) {
    std::vector<const stt::TranscriptionResult*> ordered;
    ordered.reserve(state.buffer.size() + 1);
    for (const auto& entry : state.buffer) {
        if (incoming && incoming->sequence < entry.first) {
            ordered.push_back(incoming);
            incoming = nullptr;
        }
        ordered.push_back(&entry.second);
    }
    if (incoming) {
        ordered.push_back(incoming);
    }

    std::set<uint64_t> skipped;
    for (const auto* result : ordered) {
        for (uint64_t missing = state.nextExpected; missing < result->sequence; ++missing) {
            skipped.insert(missing);
            state.skipped.insert(missing);
        }
        emitFinal(state, *result);
        state.nextExpected = result->sequence + 1;
    }
    state.buffer.clear();
    state.gapStart.reset();
    forcedFlushes_++;
    return skipped;
}

} // namespace core
} // namespace voicebridge
