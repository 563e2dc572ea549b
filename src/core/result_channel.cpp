#include "core/result_channel.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace voicebridge {
namespace core {

ResultChannel::ResultChannel(std::string sessionId, size_t capacity)
    : sessionId_(std::move(sessionId)), capacity_(capacity == 0 ? 1 : capacity) {
}

bool ResultChannel::isEvictable(const OutboundMessage& message) {
    return message.type == OutboundType::TRANSCRIPTION && !message.isFinal;
}

bool ResultChannel::push(OutboundMessage message) {
    Notifier notifier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        if (queue_.size() >= capacity_) {
            auto victim = std::find_if(queue_.begin(), queue_.end(), [](const OutboundMessage& queued) {
                return isEvictable(queued);
            });
            if (victim != queue_.end()) {
                queue_.erase(victim);
                dropped_++;
                utils::Logger::warn("Outbound queue full for session " + sessionId_ + ", dropped an interim result");
            } else if (isEvictable(message) || message.type == OutboundType::STATUS ||
                       message.type == OutboundType::PONG) {
                dropped_++;
                utils::Logger::warn("Outbound queue full for session " + sessionId_ + ", refused a non-final message");
                return false;
            } else {
                // Finals and errors are never dropped; the queue grows past capacity
                overflowed_++;
                utils::Logger::warn("Outbound queue for session " + sessionId_ + " over capacity (" +
                                    std::to_string(queue_.size() + 1) + " messages)");
            }
        }

        queue_.push_back(std::move(message));
        pushed_++;
        notifier = notifier_;
    }
    condition_.notify_one();

    if (notifier) {
        notifier();
    }
    return true;
}

std::optional<OutboundMessage> ResultChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    OutboundMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

std::vector<OutboundMessage> ResultChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutboundMessage> messages(std::make_move_iterator(queue_.begin()),
                                          std::make_move_iterator(queue_.end()));
    queue_.clear();
    return messages;
}

std::optional<OutboundMessage> ResultChannel::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    OutboundMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void ResultChannel::setNotifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

void ResultChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        notifier_ = nullptr;
    }
    condition_.notify_all();
}

bool ResultChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ResultChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t ResultChannel::getPushedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
}

uint64_t ResultChannel::getDroppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

uint64_t ResultChannel::getOverflowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflowed_;
}

} // namespace core
} // namespace voicebridge
