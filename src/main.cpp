#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "core/health_reporter.hpp"
#include "core/provider_dispatcher.hpp"
#include "core/rate_limiter.hpp"
#include "core/result_broadcaster.hpp"
#include "core/session_manager.hpp"
#include "core/websocket_server.hpp"
#include "queue/in_memory_broker.hpp"
#include "queue/queue_bridge.hpp"
#include "stt/provider_factory.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace voicebridge;

namespace {

std::atomic<bool> g_stopRequested{false};

void handleSignal(int) {
    g_stopRequested = true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>      Configuration file (default: config/server.json)\n"
              << "  --port <port>        Set server port (default: 8080)\n"
              << "  --log-level <level>  DEBUG, INFO, WARN or ERROR\n"
              << "  --help, -h           Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    utils::Logger::initialize();

    std::string configPath = "config/server.json";
    std::string portOverride;
    std::string levelOverride;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            portOverride = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            levelOverride = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        auto config = utils::Config::load(configPath);
        if (!portOverride.empty()) {
            try {
                config.server.port = std::stoi(portOverride);
            } catch (const std::exception&) {
                throw utils::ConfigException("Invalid --port value '" + portOverride + "'");
            }
        }
        if (!levelOverride.empty()) {
            config.server.logLevel = levelOverride;
        }
        auto problems = config.validate();
        if (!problems.empty()) {
            throw utils::ConfigException("Invalid configuration: " + problems.front(), configPath);
        }

        utils::LogLevel level = utils::LogLevel::INFO;
        if (!utils::Logger::parseLevel(config.server.logLevel, level)) {
            throw utils::ConfigException("Unknown log level '" + config.server.logLevel + "'", configPath);
        }
        utils::Logger::setLevel(level);

        auto providers = stt::createProviders(config);
        if (providers.empty()) {
            utils::Logger::warn("No transcription providers configured; every segment will fail");
        }

        core::ProviderDispatcher::Options dispatchOptions;
        dispatchOptions.providerTimeout = config.dispatch.providerTimeout;
        dispatchOptions.attemptsPerProvider = config.dispatch.attemptsPerProvider;
        dispatchOptions.maxInFlightPerSession = config.dispatch.maxInFlightPerSession;
        dispatchOptions.maxPendingPerSession = config.dispatch.maxPendingPerSession;
        dispatchOptions.workerThreads = config.dispatch.workerThreads;
        dispatchOptions.callThreads = config.dispatch.callThreads;
        auto dispatcher = std::make_shared<core::ProviderDispatcher>(providers, dispatchOptions);
        dispatcher->start();

        core::ResultBroadcaster::Options orderingOptions;
        orderingOptions.reorderBufferSize = config.ordering.reorderBufferSize;
        orderingOptions.reorderTimeout = config.ordering.reorderTimeout;
        auto broadcaster = std::make_shared<core::ResultBroadcaster>(orderingOptions);

        std::shared_ptr<queue::QueueBridge> bridge;
        if (config.queue.enabled) {
            auto broker = std::make_shared<queue::InMemoryBroker>(config.queue.partitions,
                                                                  config.queue.maxRedeliveries);
            queue::QueueBridge::Options bridgeOptions;
            bridgeOptions.segmentTopic = config.queue.segmentTopic;
            bridgeOptions.resultTopic = config.queue.resultTopic;
            bridgeOptions.workerCount = config.queue.workerCount;
            bridgeOptions.reconnectInterval = config.queue.reconnectInterval;
            bridge = std::make_shared<queue::QueueBridge>(
                broker, dispatcher,
                [broadcaster](const stt::TranscriptionResult& result) { broadcaster->deliver(result); },
                bridgeOptions);
            bridge->start();
        }

        auto admission = std::make_shared<core::RateLimiter>(config.rateLimit.ratePerSecond,
                                                             config.rateLimit.burst);
        std::shared_ptr<core::RateLimiter> ingestLimiter;
        if (config.sessions.throttleIngest) {
            ingestLimiter = std::make_shared<core::RateLimiter>(config.sessions.ingestRatePerSecond,
                                                                config.sessions.ingestBurst);
        }

        core::SessionManagerConfig sessionConfig;
        sessionConfig.maxSessions = config.sessions.maxSessions;
        sessionConfig.maxSessionsPerClient = config.sessions.maxSessionsPerClient;
        sessionConfig.idleTimeout = config.sessions.idleTimeout;
        sessionConfig.drainGrace = config.sessions.drainGrace;
        sessionConfig.housekeepingInterval = config.sessions.housekeepingInterval;
        sessionConfig.audioFormat = audio::AudioFormat(config.audio.codec, config.audio.sampleRate,
                                                       config.audio.channels, config.audio.bitsPerSample);
        sessionConfig.window = std::chrono::milliseconds(config.audio.windowMs);
        sessionConfig.outboundQueueCapacity = config.ordering.outboundQueueCapacity;

        auto sessions = std::make_shared<core::SessionManager>(sessionConfig, dispatcher, broadcaster,
                                                               admission, ingestLimiter, bridge);
        sessions->start();

        auto health = std::make_shared<core::HealthReporter>(sessions, dispatcher, bridge,
                                                             core::HealthReporter::Options{});

        auto server = std::make_unique<core::WebSocketServer>(config.server.port, sessions, health);
        server->setAuthorizer(core::makeTokenAuthorizer(config.server.authTokens, config.server.requireAuth));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        utils::Logger::info("Starting VoiceBridge on port " + std::to_string(config.server.port));
        server->start();

        std::atomic<bool> finished{false};
        std::thread watcher([&]() {
            while (!g_stopRequested && !finished) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            if (g_stopRequested) {
                server->stop();
            }
        });

        bool serverFailed = false;
        std::string failure;
        try {
            server->run();
        } catch (const std::exception& e) {
            serverFailed = true;
            failure = e.what();
        }
        finished = true;
        watcher.join();
        if (serverFailed) {
            utils::Logger::error("Server loop failed: " + failure);
        }

        utils::Logger::info("Shutting down...");
        sessions->shutdown();
        if (bridge) {
            bridge->stop();
        }
        dispatcher->stop();
        if (serverFailed) {
            return 1;
        }

    } catch (const utils::ConfigException& e) {
        utils::Logger::error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        utils::Logger::error(std::string("Fatal error: ") + e.what());
        return 1;
    }

    return 0;
}
