#pragma once

#include "queue/message_broker.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace voicebridge {
namespace queue {

/**
 * In-process broker with partitioned topics and at-least-once delivery.
 * One delivery thread runs per partition and consumer group. A handler that
 * throws gets the message again, up to maxRedeliveries times, after which
 * the message is dead-lettered. setAvailable(false) simulates an outage:
 * publishing fails and delivery pauses until it is restored.
 */
class InMemoryBroker : public MessageBroker {
public:
    struct Statistics {
        uint64_t published = 0;
        uint64_t delivered = 0;
        uint64_t redelivered = 0;
        uint64_t deadLettered = 0;
    };

    explicit InMemoryBroker(size_t partitions = 4, int maxRedeliveries = 3);
    ~InMemoryBroker() override;

    bool connect() override;
    bool isConnected() const override;
    void publish(const BrokerMessage& message) override;
    void subscribe(const std::string& topic, const std::string& group, MessageHandler handler) override;
    void close() override;

    void setAvailable(bool available);
    bool isAvailable() const { return available_; }

    size_t partitionFor(const std::string& key) const;
    size_t getPartitionCount() const { return partitions_; }
    size_t getBacklog(const std::string& topic) const;
    Statistics getStatistics() const;

private:
    struct Partition {
        std::deque<BrokerMessage> messages;
        std::thread thread;
    };

    struct Group {
        std::string topic;
        std::string name;
        std::vector<MessageHandler> members;
        std::vector<std::unique_ptr<Partition>> partitions;
    };

    void deliveryLoop(Group* group, size_t partition);

    size_t partitions_;
    int maxRedeliveries_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::map<std::string, std::vector<std::unique_ptr<Group>>> groups_;
    // Messages published to topics nobody subscribes to yet
    std::map<std::string, std::deque<BrokerMessage>> retained_;
    std::atomic<bool> available_;
    std::atomic<bool> connected_;
    std::atomic<bool> closed_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> redelivered_{0};
    std::atomic<uint64_t> deadLettered_{0};
};

} // namespace queue
} // namespace voicebridge
