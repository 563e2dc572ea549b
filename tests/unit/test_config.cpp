#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <fstream>

using namespace voicebridge::utils;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_path_.empty()) {
            std::remove(temp_path_.c_str());
        }
    }

    std::string writeTempFile(const std::string& content) {
        temp_path_ = "voicebridge_config_test.json";
        std::ofstream out(temp_path_);
        out << content;
        return temp_path_;
    }

    std::string temp_path_;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");
    EXPECT_EQ(config.getPort(), 8080);
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.sessions.maxSessions, 100u);
    EXPECT_EQ(config.sessions.maxSessionsPerClient, 5u);
    EXPECT_EQ(config.sessions.idleTimeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(config.sessions.drainGrace, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.audio.windowMs, 250u);
    EXPECT_EQ(config.dispatch.attemptsPerProvider, 2);
    EXPECT_EQ(config.dispatch.providerTimeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.ordering.reorderBufferSize, 8u);
    EXPECT_EQ(config.queue.segmentTopic, "audio.segments");
    EXPECT_EQ(config.queue.resultTopic, "transcription.results");
    EXPECT_FALSE(config.queue.enabled);
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigTest, EmptyFileYieldsDefaults) {
    auto config = Config::load(writeTempFile("  \n"));
    EXPECT_EQ(config.getPort(), 8080);
}

TEST_F(ConfigTest, LoadsSectionsFromFile) {
    auto path = writeTempFile(R"({
        "server": {"port": 9001, "logLevel": "DEBUG"},
        "sessions": {"maxSessions": 3, "maxSessionsPerClient": 1, "drainGraceMs": 750},
        "dispatch": {"attemptsPerProvider": 1, "providerTimeoutMs": 200},
        "providers": [
            {"name": "primary", "url": "http://localhost:8081"},
            {"name": "backup", "url": "https://api.example.com", "apiFormat": "openai", "apiKey": "k"}
        ],
        "queue": {"enabled": true, "partitions": 2, "workerCount": 3}
    })");

    auto config = Config::load(path);
    EXPECT_EQ(config.getPort(), 9001);
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.sessions.maxSessions, 3u);
    EXPECT_EQ(config.sessions.maxSessionsPerClient, 1u);
    EXPECT_EQ(config.sessions.drainGrace, std::chrono::milliseconds(750));
    EXPECT_EQ(config.dispatch.attemptsPerProvider, 1);
    EXPECT_EQ(config.dispatch.providerTimeout, std::chrono::milliseconds(200));
    ASSERT_EQ(config.providers.size(), 2u);
    EXPECT_EQ(config.providers[0].name, "primary");
    EXPECT_EQ(config.providers[0].apiFormat, "whisper.cpp");
    EXPECT_EQ(config.providers[1].apiFormat, "openai");
    EXPECT_EQ(config.providers[1].apiKey, "k");
    EXPECT_TRUE(config.queue.enabled);
    EXPECT_EQ(config.queue.partitions, 2u);
    EXPECT_EQ(config.queue.workerCount, 3u);
    // untouched keys keep defaults
    EXPECT_EQ(config.ordering.reorderBufferSize, 8u);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    auto path = writeTempFile("{ \"server\": { \"port\": ");
    EXPECT_THROW(Config::load(path), ConfigException);
}

TEST_F(ConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(Config::fromJson(R"({"server": {"port": 70000}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"server": {"logLevel": "LOUD"}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"dispatch": {"attemptsPerProvider": 0}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"providers": [{"name": "x", "type": "grpc", "url": "u"}]})"),
                 ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"server": {"requireAuth": true}})"), ConfigException);
}

TEST_F(ConfigTest, ExceptionCarriesConfigCategory) {
    try {
        Config::fromJson("[1, 2]", "inline.json");
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getErrorInfo().category, ErrorCategory::CONFIG);
        EXPECT_NE(std::string(e.what()).find("inline.json"), std::string::npos);
    }
}

TEST_F(ConfigTest, ValidateReportsEveryProblem) {
    Config config;
    config.server.port = 0;
    config.sessions.maxSessions = 0;
    config.ordering.reorderBufferSize = 0;
    EXPECT_EQ(config.validate().size(), 3u);
}
