#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace voicebridge {
namespace utils {

class JsonValue;

struct ServerSettings {
    int port = 8080;
    std::string logLevel = "INFO";
    bool requireAuth = false;
    std::vector<std::string> authTokens;
};

struct SessionSettings {
    size_t maxSessions = 100;
    size_t maxSessionsPerClient = 5;
    std::chrono::milliseconds idleTimeout{60000};
    std::chrono::milliseconds drainGrace{5000};
    std::chrono::milliseconds housekeepingInterval{100};
    bool throttleIngest = false;
    double ingestRatePerSecond = 50.0;
    double ingestBurst = 100.0;
};

struct AudioSettings {
    uint32_t sampleRate = 16000;
    uint16_t channels = 1;
    uint16_t bitsPerSample = 16;
    uint32_t windowMs = 250;
    std::string codec = "pcm_s16le";
};

struct DispatchSettings {
    std::chrono::milliseconds providerTimeout{5000};
    int attemptsPerProvider = 2;
    size_t maxInFlightPerSession = 2;
    size_t maxPendingPerSession = 64;
    size_t workerThreads = 4;
    size_t callThreads = 8;
};

struct ProviderSettings {
    std::string name;
    std::string type = "http";
    std::string url;
    std::string apiFormat = "whisper.cpp";
    std::string apiKey;
    std::string model = "whisper-1";
    std::string language = "en";
    float defaultConfidence = 0.9f;
};

struct OrderingSettings {
    size_t reorderBufferSize = 8;
    std::chrono::milliseconds reorderTimeout{2000};
    size_t outboundQueueCapacity = 256;
};

struct RateLimitSettings {
    double ratePerSecond = 1.0;
    double burst = 10.0;
};

struct QueueSettings {
    bool enabled = false;
    std::string segmentTopic = "audio.segments";
    std::string resultTopic = "transcription.results";
    size_t partitions = 4;
    size_t workerCount = 4;
    std::chrono::milliseconds reconnectInterval{10000};
    int maxRedeliveries = 3;
};

/**
 * Server configuration loaded from a JSON file.
 * Every section is optional; missing keys keep their defaults.
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from a file. A missing file yields defaults,
     * an unreadable or invalid file throws ConfigException.
     */
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& json, const std::string& origin = "<inline>");

    /**
     * Returns human readable problems; empty when the configuration is usable.
     */
    std::vector<std::string> validate() const;

    int getPort() const { return server.port; }
    std::string getLogLevel() const { return server.logLevel; }

    ServerSettings server;
    SessionSettings sessions;
    AudioSettings audio;
    DispatchSettings dispatch;
    std::vector<ProviderSettings> providers;
    OrderingSettings ordering;
    RateLimitSettings rateLimit;
    QueueSettings queue;

private:
    void applyJson(const JsonValue& root);
};

} // namespace utils
} // namespace voicebridge
