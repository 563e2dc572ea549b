#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace voicebridge {
namespace queue {

struct BrokerMessage {
    std::string topic;
    std::string key;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> payload;
    int deliveryAttempt = 0;  // 0 on first delivery

    std::string header(const std::string& name, const std::string& fallback = "") const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : fallback;
    }
};

// A throwing handler asks for redelivery
using MessageHandler = std::function<void(const BrokerMessage&)>;

/**
 * Durable topic broker seam. Messages with equal keys land on the same
 * partition and are delivered in publish order to one member of each
 * consumer group.
 */
class MessageBroker {
public:
    virtual ~MessageBroker() = default;

    virtual bool connect() = 0;
    virtual bool isConnected() const = 0;

    // Throws QueueUnavailableException when the broker cannot accept the message
    virtual void publish(const BrokerMessage& message) = 0;

    // Adds a member to the consumer group; partitions are spread across members
    virtual void subscribe(const std::string& topic, const std::string& group, MessageHandler handler) = 0;

    virtual void close() = 0;
};

} // namespace queue
} // namespace voicebridge
