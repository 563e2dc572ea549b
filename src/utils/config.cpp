#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace voicebridge {
namespace utils {

namespace {

std::chrono::milliseconds millis(const JsonValue& section, const std::string& key,
                                 std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(static_cast<int64_t>(
        section.getNumber(key, static_cast<double>(fallback.count()))));
}

size_t count(const JsonValue& section, const std::string& key, size_t fallback) {
    double value = section.getNumber(key, static_cast<double>(fallback));
    return value < 0 ? 0 : static_cast<size_t>(value);
}

} // namespace

Config Config::load(const std::string& configPath) {
    Config config;

    if (!std::filesystem::exists(configPath)) {
        Logger::info("Configuration file not found: " + configPath + ", using defaults");
        return config;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();
    if (json.find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::info("Empty configuration file, using defaults");
        return config;
    }

    config = fromJson(json, configPath);
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& json, const std::string& origin) {
    JsonValue root;
    try {
        root = JsonParser::parse(json);
    } catch (const std::exception& e) {
        throw ConfigException("Malformed configuration: " + std::string(e.what()), origin);
    }
    if (!root.isObject()) {
        throw ConfigException("Configuration root must be an object", origin);
    }

    Config config;
    config.applyJson(root);

    auto problems = config.validate();
    if (!problems.empty()) {
        std::string joined;
        for (const auto& problem : problems) {
            if (!joined.empty()) joined += "; ";
            joined += problem;
        }
        throw ConfigException("Invalid configuration: " + joined, origin);
    }
    return config;
}

void Config::applyJson(const JsonValue& root) {
    const auto& s = root.getProperty("server");
    if (s.isObject()) {
        server.port = static_cast<int>(s.getNumber("port", server.port));
        server.logLevel = s.getString("logLevel", server.logLevel);
        server.requireAuth = s.getBool("requireAuth", server.requireAuth);
        const auto& tokens = s.getProperty("authTokens");
        if (tokens.isArray()) {
            server.authTokens.clear();
            for (const auto& token : tokens.asArray()) {
                if (token.isString()) {
                    server.authTokens.push_back(token.asString());
                }
            }
        }
    }

    const auto& ss = root.getProperty("sessions");
    if (ss.isObject()) {
        sessions.maxSessions = count(ss, "maxSessions", sessions.maxSessions);
        sessions.maxSessionsPerClient = count(ss, "maxSessionsPerClient", sessions.maxSessionsPerClient);
        sessions.idleTimeout = millis(ss, "idleTimeoutMs", sessions.idleTimeout);
        sessions.drainGrace = millis(ss, "drainGraceMs", sessions.drainGrace);
        sessions.housekeepingInterval = millis(ss, "housekeepingIntervalMs", sessions.housekeepingInterval);
        sessions.throttleIngest = ss.getBool("throttleIngest", sessions.throttleIngest);
        sessions.ingestRatePerSecond = ss.getNumber("ingestRatePerSecond", sessions.ingestRatePerSecond);
        sessions.ingestBurst = ss.getNumber("ingestBurst", sessions.ingestBurst);
    }

    const auto& a = root.getProperty("audio");
    if (a.isObject()) {
        audio.sampleRate = static_cast<uint32_t>(a.getNumber("sampleRate", audio.sampleRate));
        audio.channels = static_cast<uint16_t>(a.getNumber("channels", audio.channels));
        audio.bitsPerSample = static_cast<uint16_t>(a.getNumber("bitsPerSample", audio.bitsPerSample));
        audio.windowMs = static_cast<uint32_t>(a.getNumber("windowMs", audio.windowMs));
        audio.codec = a.getString("codec", audio.codec);
    }

    const auto& d = root.getProperty("dispatch");
    if (d.isObject()) {
        dispatch.providerTimeout = millis(d, "providerTimeoutMs", dispatch.providerTimeout);
        dispatch.attemptsPerProvider = static_cast<int>(d.getNumber("attemptsPerProvider", dispatch.attemptsPerProvider));
        dispatch.maxInFlightPerSession = count(d, "maxInFlightPerSession", dispatch.maxInFlightPerSession);
        dispatch.maxPendingPerSession = count(d, "maxPendingPerSession", dispatch.maxPendingPerSession);
        dispatch.workerThreads = count(d, "workerThreads", dispatch.workerThreads);
        dispatch.callThreads = count(d, "callThreads", dispatch.callThreads);
    }

    const auto& p = root.getProperty("providers");
    if (p.isArray()) {
        providers.clear();
        for (const auto& entry : p.asArray()) {
            if (!entry.isObject()) {
                continue;
            }
            ProviderSettings provider;
            provider.name = entry.getString("name");
            provider.type = entry.getString("type", provider.type);
            provider.url = entry.getString("url");
            provider.apiFormat = entry.getString("apiFormat", provider.apiFormat);
            provider.apiKey = entry.getString("apiKey");
            provider.model = entry.getString("model", provider.model);
            provider.language = entry.getString("language", provider.language);
            provider.defaultConfidence = static_cast<float>(
                entry.getNumber("defaultConfidence", provider.defaultConfidence));
            providers.push_back(provider);
        }
    }

    const auto& o = root.getProperty("ordering");
    if (o.isObject()) {
        ordering.reorderBufferSize = count(o, "reorderBufferSize", ordering.reorderBufferSize);
        ordering.reorderTimeout = millis(o, "reorderTimeoutMs", ordering.reorderTimeout);
        ordering.outboundQueueCapacity = count(o, "outboundQueueCapacity", ordering.outboundQueueCapacity);
    }

    const auto& r = root.getProperty("rateLimit");
    if (r.isObject()) {
        rateLimit.ratePerSecond = r.getNumber("ratePerSecond", rateLimit.ratePerSecond);
        rateLimit.burst = r.getNumber("burst", rateLimit.burst);
    }

    const auto& q = root.getProperty("queue");
    if (q.isObject()) {
        queue.enabled = q.getBool("enabled", queue.enabled);
        queue.segmentTopic = q.getString("segmentTopic", queue.segmentTopic);
        queue.resultTopic = q.getString("resultTopic", queue.resultTopic);
        queue.partitions = count(q, "partitions", queue.partitions);
        queue.workerCount = count(q, "workerCount", queue.workerCount);
        queue.reconnectInterval = millis(q, "reconnectIntervalMs", queue.reconnectInterval);
        queue.maxRedeliveries = static_cast<int>(q.getNumber("maxRedeliveries", queue.maxRedeliveries));
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (server.port <= 0 || server.port > 65535) {
        problems.push_back("server.port must be in 1..65535");
    }
    LogLevel level;
    if (!Logger::parseLevel(server.logLevel, level)) {
        problems.push_back("server.logLevel must be DEBUG, INFO, WARN or ERROR");
    }
    if (server.requireAuth && server.authTokens.empty()) {
        problems.push_back("server.requireAuth needs at least one entry in server.authTokens");
    }
    if (sessions.maxSessions == 0) {
        problems.push_back("sessions.maxSessions must be positive");
    }
    if (sessions.maxSessionsPerClient == 0) {
        problems.push_back("sessions.maxSessionsPerClient must be positive");
    }
    if (sessions.housekeepingInterval.count() <= 0) {
        problems.push_back("sessions.housekeepingIntervalMs must be positive");
    }
    if (sessions.throttleIngest && (sessions.ingestRatePerSecond <= 0 || sessions.ingestBurst < 1)) {
        problems.push_back("sessions.ingestRatePerSecond must be positive and ingestBurst at least 1");
    }
    if (audio.sampleRate == 0 || audio.channels == 0 || audio.bitsPerSample == 0 ||
        audio.bitsPerSample % 8 != 0) {
        problems.push_back("audio format needs positive sampleRate/channels and whole-byte bitsPerSample");
    }
    if (audio.windowMs < 20 || audio.windowMs > 10000) {
        problems.push_back("audio.windowMs must be in 20..10000");
    }
    if (dispatch.providerTimeout.count() <= 0) {
        problems.push_back("dispatch.providerTimeoutMs must be positive");
    }
    if (dispatch.attemptsPerProvider < 1) {
        problems.push_back("dispatch.attemptsPerProvider must be at least 1");
    }
    if (dispatch.maxInFlightPerSession == 0) {
        problems.push_back("dispatch.maxInFlightPerSession must be positive");
    }
    if (dispatch.workerThreads == 0 || dispatch.callThreads == 0) {
        problems.push_back("dispatch.workerThreads and dispatch.callThreads must be positive");
    }
    for (size_t i = 0; i < providers.size(); ++i) {
        const auto& provider = providers[i];
        std::string where = "providers[" + std::to_string(i) + "]";
        if (provider.name.empty()) {
            problems.push_back(where + ".name is required");
        }
        if (provider.type != "http") {
            problems.push_back(where + ".type '" + provider.type + "' is not supported");
        }
        if (provider.type == "http" && provider.url.empty()) {
            problems.push_back(where + ".url is required for http providers");
        }
        if (provider.apiFormat != "whisper.cpp" && provider.apiFormat != "openai") {
            problems.push_back(where + ".apiFormat must be whisper.cpp or openai");
        }
        if (provider.defaultConfidence < 0.0f || provider.defaultConfidence > 1.0f) {
            problems.push_back(where + ".defaultConfidence must be in [0,1]");
        }
    }
    if (ordering.reorderBufferSize == 0) {
        problems.push_back("ordering.reorderBufferSize must be positive");
    }
    if (ordering.reorderTimeout.count() <= 0) {
        problems.push_back("ordering.reorderTimeoutMs must be positive");
    }
    if (ordering.outboundQueueCapacity == 0) {
        problems.push_back("ordering.outboundQueueCapacity must be positive");
    }
    if (rateLimit.ratePerSecond <= 0 || rateLimit.burst < 1) {
        problems.push_back("rateLimit.ratePerSecond must be positive and burst at least 1");
    }
    if (queue.enabled) {
        if (queue.segmentTopic.empty() || queue.resultTopic.empty()) {
            problems.push_back("queue topics must be named");
        }
        if (queue.partitions == 0 || queue.workerCount == 0) {
            problems.push_back("queue.partitions and queue.workerCount must be positive");
        }
    }

    return problems;
}

} // namespace utils
} // namespace voicebridge
