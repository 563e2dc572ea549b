#include "queue/in_memory_broker.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <functional>

namespace voicebridge {
namespace queue {

InMemoryBroker::InMemoryBroker(size_t partitions, int maxRedeliveries)
    : partitions_(partitions == 0 ? 1 : partitions),
      maxRedeliveries_(maxRedeliveries < 0 ? 0 : maxRedeliveries),
      available_(true), connected_(false), closed_(false) {
}

InMemoryBroker::~InMemoryBroker() {
    close();
}

bool InMemoryBroker::connect() {
    if (closed_ || !available_) {
        connected_ = false;
        return false;
    }
    connected_ = true;
    return true;
}

bool InMemoryBroker::isConnected() const {
    return connected_ && available_ && !closed_;
}

size_t InMemoryBroker::partitionFor(const std::string& key) const {
    return std::hash<std::string>{}(key) % partitions_;
}

void InMemoryBroker::publish(const BrokerMessage& message) {
    if (closed_) {
        throw utils::QueueUnavailableException("broker closed");
    }
    if (!available_) {
        connected_ = false;
        throw utils::QueueUnavailableException("broker unreachable");
    }
    if (!connected_) {
        throw utils::QueueUnavailableException("broker not connected");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = groups_.find(message.topic);
        if (it == groups_.end() || it->second.empty()) {
            retained_[message.topic].push_back(message);
        } else {
            size_t partition = partitionFor(message.key);
            for (auto& group : it->second) {
                group->partitions[partition]->messages.push_back(message);
            }
        }
    }
    published_++;
    condition_.notify_all();
}

void InMemoryBroker::subscribe(const std::string& topic, const std::string& group, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw utils::QueueUnavailableException("broker closed");
    }

    auto& groups = groups_[topic];
    for (auto& existing : groups) {
        if (existing->name == group) {
            existing->members.push_back(std::move(handler));
            return;
        }
    }

    auto created = std::make_unique<Group>();
    created->topic = topic;
    created->name = group;
    created->members.push_back(std::move(handler));
    for (size_t i = 0; i < partitions_; ++i) {
        created->partitions.push_back(std::make_unique<Partition>());
    }

    // The first group on a topic receives what was published before it existed
    if (groups.empty()) {
        auto retained = retained_.find(topic);
        if (retained != retained_.end()) {
            for (auto& message : retained->second) {
                created->partitions[partitionFor(message.key)]->messages.push_back(std::move(message));
            }
            retained_.erase(retained);
        }
    }

    Group* raw = created.get();
    for (size_t i = 0; i < partitions_; ++i) {
        raw->partitions[i]->thread = std::thread(&InMemoryBroker::deliveryLoop, this, raw, i);
    }
    groups.push_back(std::move(created));
    utils::Logger::debug("Consumer group " + group + " subscribed to " + topic);
}

void InMemoryBroker::deliveryLoop(Group* group, size_t partition) {
    Partition& part = *group->partitions[partition];

    while (true) {
        BrokerMessage message;
        MessageHandler handler;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [&] {
                return closed_ || (available_ && !part.messages.empty());
            });
            if (closed_) {
                return;
            }
            message = part.messages.front();
            part.messages.pop_front();
            handler = group->members[partition % group->members.size()];
        }

        try {
            handler(message);
            delivered_++;
        } catch (const std::exception& e) {
            if (message.deliveryAttempt < maxRedeliveries_) {
                message.deliveryAttempt++;
                redelivered_++;
                utils::Logger::warn("Redelivering message " + message.key + " on " + group->topic +
                                    " (attempt " + std::to_string(message.deliveryAttempt) + "): " + e.what());
                std::lock_guard<std::mutex> lock(mutex_);
                part.messages.push_front(std::move(message));
            } else {
                deadLettered_++;
                utils::ErrorInfo info(utils::ErrorCategory::QUEUE, utils::ErrorSeverity::ERROR,
                                      "Message dead-lettered after redeliveries", e.what(),
                                      group->topic + "/" + group->name, message.header("session-id"));
                utils::ErrorHandler::getInstance().reportError(info);
            }
        }
    }
}

void InMemoryBroker::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        connected_ = false;
    }
    condition_.notify_all();

    // Threads are joined outside the lock; groups_ is no longer modified once closed
    for (auto& topic : groups_) {
        for (auto& group : topic.second) {
            for (auto& partition : group->partitions) {
                if (partition->thread.joinable()) {
                    partition->thread.join();
                }
            }
        }
    }
}

void InMemoryBroker::setAvailable(bool available) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = available;
        if (!available) {
            connected_ = false;
        }
    }
    condition_.notify_all();
    utils::Logger::info(std::string("In-memory broker ") + (available ? "available" : "unavailable"));
}

size_t InMemoryBroker::getBacklog(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t backlog = 0;
    auto retained = retained_.find(topic);
    if (retained != retained_.end()) {
        backlog += retained->second.size();
    }
    auto it = groups_.find(topic);
    if (it != groups_.end()) {
        for (const auto& group : it->second) {
            for (const auto& partition : group->partitions) {
                backlog += partition->messages.size();
            }
        }
    }
    return backlog;
}

InMemoryBroker::Statistics InMemoryBroker::getStatistics() const {
    Statistics stats;
    stats.published = published_;
    stats.delivered = delivered_;
    stats.redelivered = redelivered_;
    stats.deadLettered = deadLettered_;
    return stats;
}

} // namespace queue
} // namespace voicebridge
