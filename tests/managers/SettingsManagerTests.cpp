/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>

using namespace VanguardEngine;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    SettingsManager settings;
    const std::string testFile =
        (std::filesystem::temp_directory_path() / "vanguard_test_settings.json").string();

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
        file.close();
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypes) {
    BOOST_CHECK(settings.set("connection", "max_connected_players", 4));
    BOOST_CHECK_EQUAL(settings.get<int>("connection", "max_connected_players", 0), 4);

    BOOST_CHECK(settings.set("connection", "connect_timeout", 2.5f));
    BOOST_CHECK_CLOSE(settings.get<float>("connection", "connect_timeout", 0.0f), 2.5f, 0.001f);

    BOOST_CHECK(settings.set("connection", "reconnection_enabled", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("connection", "reconnection_enabled", true), false);

    BOOST_CHECK(settings.set("server", "player_name", std::string("Ada")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("server", "player_name", ""), "Ada");

    // Test default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("connection", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveAndClear) {
    settings.set("test", "key1", 1);
    settings.set("test", "key2", 2);
    settings.set("other", "key1", 3);

    BOOST_CHECK(settings.remove("test", "key1"));
    BOOST_CHECK(!settings.has("test", "key1"));
    BOOST_CHECK(settings.has("test", "key2"));
    BOOST_CHECK(!settings.remove("test", "nonexistent"));

    BOOST_CHECK(settings.clearCategory("test"));
    BOOST_CHECK(!settings.has("test", "key2"));
    BOOST_CHECK(settings.has("other", "key1"));
    BOOST_CHECK(!settings.clearCategory("nonexistent"));

    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestGetKeys) {
    settings.set("test", "key1", 1);
    settings.set("test", "key2", 2);
    settings.set("test", "key3", 3);

    BOOST_CHECK_EQUAL(settings.getKeys("test").size(), 3);
    BOOST_CHECK_EQUAL(settings.getKeys("nonexistent").size(), 0);
}

BOOST_AUTO_TEST_CASE(TestLoadAndSaveRoundTrip) {
    createTestFile(R"({
  "server": { "tick_rate": 60, "player_name": "Host" },
  "connection": { "connect_timeout": 3.5, "reconnection_enabled": false }
})");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("server", "tick_rate", 0), 60);
    BOOST_CHECK_CLOSE(settings.get<float>("connection", "connect_timeout", 0.0f), 3.5f, 0.001f);

    settings.set("ai", "seed", 99);
    BOOST_REQUIRE(settings.saveToFile(testFile));

    SettingsManager reloaded;
    BOOST_REQUIRE(reloaded.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(reloaded.get<int>("ai", "seed", 0), 99);
    BOOST_CHECK_EQUAL(reloaded.get<std::string>("server", "player_name", ""), "Host");
    BOOST_CHECK_EQUAL(reloaded.get<bool>("connection", "reconnection_enabled", true), false);
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    int callbackCount = 0;
    std::string lastKey;

    auto callbackId = settings.registerChangeListener("connection",
        [&](const std::string&, const std::string& key, const SettingsManager::SettingValue&) {
            callbackCount++;
            lastKey = key;
        });
    int globalCount = 0;
    auto globalId = settings.registerChangeListener("",
        [&](const std::string&, const std::string&, const SettingsManager::SettingValue&) {
            globalCount++;
        });

    settings.set("connection", "max_connected_players", 2);
    settings.set("connection", "connect_timeout", 1.0f);
    settings.set("ai", "seed", 5);  // Different category, shouldn't trigger

    BOOST_CHECK_EQUAL(callbackCount, 2);
    BOOST_CHECK_EQUAL(lastKey, "connect_timeout");
    BOOST_CHECK_EQUAL(globalCount, 3);

    settings.unregisterChangeListener(callbackId);
    settings.unregisterChangeListener(globalId);
    settings.set("connection", "max_connected_players", 3);

    BOOST_CHECK_EQUAL(callbackCount, 2);
    BOOST_CHECK_EQUAL(globalCount, 3);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    const int numThreads = 8;
    const int operationsPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([this, t, count = operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                settings.set("category" + std::to_string(t), "key" + std::to_string(i), i * t);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < numThreads; ++t) {
        BOOST_CHECK_EQUAL(settings.getKeys("category" + std::to_string(t)).size(),
                          static_cast<size_t>(operationsPerThread));
    }
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    BOOST_CHECK(!settings.loadFromFile("nonexistent_file.json"));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestNumericReadsConvert) {
    settings.set("test", "value", 42);

    BOOST_CHECK_CLOSE(settings.get<float>("test", "value", 0.0f), 42.0f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ServerSettingsTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(EmptyStoreYieldsDefaults) {
    const ServerSettings s = settings.buildServerSettings();

    BOOST_CHECK_CLOSE(s.tickRate, 30.0f, 0.001f);
    BOOST_CHECK_EQUAL(s.maxConnectedPlayers, 8);
    BOOST_CHECK_EQUAL(s.maxPayloadBytes, 1024u);
    BOOST_CHECK_EQUAL(s.maxReconnectAttempts, 2);
    BOOST_CHECK_CLOSE(s.firstReconnectDelaySeconds, 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(s.reconnectIntervalSeconds, 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(s.connectTimeoutSeconds, 10.0f, 0.001f);
    BOOST_CHECK(s.reconnectionEnabled);
    BOOST_CHECK_EQUAL(s.maxDeferredQueue, 8192u);
    BOOST_CHECK_EQUAL(s.aiSeed, 1337u);
}

BOOST_AUTO_TEST_CASE(FileValuesOverrideDefaults) {
    createTestFile(R"({
  "server": { "tick_rate": 20, "demo_ticks": 100 },
  "connection": { "max_connected_players": 3, "first_reconnect_delay": 0.5 },
  "ai": { "seed": 7 }
})");
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    const ServerSettings s = settings.buildServerSettings();

    BOOST_CHECK_CLOSE(s.tickRate, 20.0f, 0.001f);
    BOOST_CHECK_EQUAL(s.demoTicks, 100u);
    BOOST_CHECK_EQUAL(s.maxConnectedPlayers, 3);
    BOOST_CHECK_CLOSE(s.firstReconnectDelaySeconds, 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(s.aiSeed, 7u);
    BOOST_CHECK_CLOSE(s.connectTimeoutSeconds, 10.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(InvalidValuesAreClamped) {
    settings.set("server", "tick_rate", -5);
    settings.set("connection", "max_reconnect_attempts", -1);
    settings.set("events", "max_deferred_queue", 0);

    const ServerSettings s = settings.buildServerSettings();

    BOOST_CHECK_CLOSE(s.tickRate, 30.0f, 0.001f);
    BOOST_CHECK_EQUAL(s.maxReconnectAttempts, 0);
    BOOST_CHECK_EQUAL(s.maxDeferredQueue, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
