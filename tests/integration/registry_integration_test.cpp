/**
 * @file registry_integration_test.cpp
 * @brief Start/stop/list commands against real loopback decoys
 */

#include <gtest/gtest.h>

#include "FTPDecoy.h"
#include "ListenerRegistry.h"
#include "SSHDecoy.h"
#include "TestSupport.h"
#include "ThreatAnalyzer.h"
#include <chrono>
#include <future>
#include <memory>

using namespace LureNet;

class ListenerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        ASSERT_TRUE(store_.open(dir_.file("registry.db")).ok());
    }

    test::TempDir dir_;
    EventStore store_;
    ThreatAnalyzer analyzer_;
    AlertPolicy alertPolicy_{store_};
    CapturePipeline pipeline_{analyzer_, store_, alertPolicy_};
};

TEST_F(ListenerRegistryTest, StartsByNameCaseInsensitively) {
    ListenerRegistry registry(pipeline_);

    ASSERT_TRUE(registry.start("ssh", "127.0.0.1", 0).ok());
    ASSERT_TRUE(registry.start("Http", "127.0.0.1", 0).ok());
    ASSERT_TRUE(registry.start(Protocol::FTP, "127.0.0.1", 0).ok());

    auto listeners = registry.list();
    ASSERT_EQ(listeners.size(), 3u);
    EXPECT_EQ(listeners[0].protocol, Protocol::SSH);
    EXPECT_EQ(listeners[1].protocol, Protocol::HTTP);
    EXPECT_EQ(listeners[2].protocol, Protocol::FTP);
    for (const auto& info : listeners) {
        EXPECT_EQ(info.host, "127.0.0.1");
        EXPECT_GT(info.port, 0);
        EXPECT_TRUE(info.isRunning);
    }
}

TEST_F(ListenerRegistryTest, UnknownProtocolIsInvalidArgument) {
    ListenerRegistry registry(pipeline_);

    auto started = registry.start("telnet", "127.0.0.1", 0);
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().code, lnt::ErrorCode::InvalidArgument);

    auto stopped = registry.stop("smtp");
    ASSERT_FALSE(stopped);
    EXPECT_EQ(stopped.error().code, lnt::ErrorCode::InvalidArgument);

    EXPECT_TRUE(registry.list().empty());
}

TEST_F(ListenerRegistryTest, SecondStartOfRunningProtocolFails) {
    ListenerRegistry registry(pipeline_);
    ASSERT_TRUE(registry.start(Protocol::SSH, "127.0.0.1", 0).ok());
    int port = registry.list()[0].port;

    auto again = registry.start(Protocol::SSH, "127.0.0.1", 0);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, lnt::ErrorCode::BindFailed);

    auto listeners = registry.list();
    ASSERT_EQ(listeners.size(), 1u);
    EXPECT_EQ(listeners[0].port, port);
    EXPECT_TRUE(listeners[0].isRunning);
}

TEST_F(ListenerRegistryTest, FailedBindLeavesNothingRegistered) {
    ListenerRegistry registry(pipeline_);
    ASSERT_TRUE(registry.start(Protocol::SSH, "127.0.0.1", 0).ok());
    int taken = registry.list()[0].port;

    auto clash = registry.start(Protocol::FTP, "127.0.0.1", taken);
    ASSERT_FALSE(clash);
    EXPECT_EQ(clash.error().code, lnt::ErrorCode::BindFailed);
    EXPECT_EQ(registry.find(Protocol::FTP), nullptr);
    EXPECT_EQ(registry.list().size(), 1u);
}

TEST_F(ListenerRegistryTest, StopKeepsEntryUntilRestart) {
    ListenerRegistry registry(pipeline_);
    ASSERT_TRUE(registry.start(Protocol::HTTP, "127.0.0.1", 0).ok());
    ASSERT_NE(registry.find(Protocol::HTTP), nullptr);

    ASSERT_TRUE(registry.stop("HTTP").ok());
    EXPECT_EQ(registry.find(Protocol::HTTP), nullptr);

    auto listeners = registry.list();
    ASSERT_EQ(listeners.size(), 1u);
    EXPECT_FALSE(listeners[0].isRunning);

    auto twice = registry.stop(Protocol::HTTP);
    ASSERT_FALSE(twice);
    EXPECT_EQ(twice.error().code, lnt::ErrorCode::NotRunning);

    ASSERT_TRUE(registry.start(Protocol::HTTP, "127.0.0.1", 0).ok());
    listeners = registry.list();
    ASSERT_EQ(listeners.size(), 1u);
    EXPECT_TRUE(listeners[0].isRunning);
}

TEST_F(ListenerRegistryTest, StopWithoutStartIsNotRunning) {
    ListenerRegistry registry(pipeline_);
    auto result = registry.stop(Protocol::FTP);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, lnt::ErrorCode::NotRunning);
}

TEST_F(ListenerRegistryTest, StopAllHaltsEveryDecoy) {
    ListenerRegistry registry(pipeline_);
    ASSERT_TRUE(registry.start(Protocol::SSH, "127.0.0.1", 0).ok());
    ASSERT_TRUE(registry.start(Protocol::FTP, "127.0.0.1", 0).ok());

    registry.stopAll();

    for (const auto& info : registry.list()) {
        EXPECT_FALSE(info.isRunning);
    }
    EXPECT_EQ(registry.find(Protocol::SSH), nullptr);
    EXPECT_EQ(registry.find(Protocol::FTP), nullptr);
}

TEST_F(ListenerRegistryTest, FindReturnsRunningDecoy) {
    ListenerRegistry registry(pipeline_);
    ASSERT_TRUE(registry.start(Protocol::FTP, "127.0.0.1", 0).ok());

    IDecoyListener* ftp = registry.find(Protocol::FTP);
    ASSERT_NE(ftp, nullptr);
    EXPECT_EQ(ftp->protocol(), Protocol::FTP);
    EXPECT_EQ(ftp->port(), registry.list()[0].port);
    EXPECT_EQ(registry.find(Protocol::SSH), nullptr);
}

TEST_F(ListenerRegistryTest, ConfiguredOptionsReachDecoys) {
    std::map<Protocol, DecoyOptions> options;
    options[Protocol::SSH].readTimeoutSec = 1;
    options[Protocol::SSH].maxSessions = 4;

    auto decoy = ListenerRegistry::createListener(Protocol::SSH, pipeline_, options[Protocol::SSH]);
    ASSERT_NE(decoy, nullptr);
    EXPECT_EQ(decoy->protocol(), Protocol::SSH);
    EXPECT_FALSE(decoy->isRunning());

    ListenerRegistry registry(pipeline_, options);
    ASSERT_TRUE(registry.start(Protocol::SSH, "127.0.0.1", 0).ok());
    EXPECT_TRUE(registry.find(Protocol::SSH)->isRunning());
}

TEST_F(ListenerRegistryTest, RestartDoesNotWaitForIdleClient) {
    ListenerRegistry registry(pipeline_);
    ASSERT_TRUE(registry.start(Protocol::FTP, "127.0.0.1", 0).ok());

    auto client = test::connectTo(registry.list()[0].port);
    ASSERT_TRUE(client);
    EXPECT_EQ(test::readLine(client.get()), FTPDecoy::BANNER);

    ASSERT_TRUE(registry.stop(Protocol::FTP).ok());

    auto restarted = std::async(std::launch::async, [&registry] {
        return registry.start(Protocol::FTP, "127.0.0.1", 0);
    });
    ASSERT_EQ(restarted.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(restarted.get().ok());

    auto listing = std::async(std::launch::async, [&registry] { return registry.list(); });
    ASSERT_EQ(listing.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto listeners = listing.get();
    ASSERT_EQ(listeners.size(), 1u);
    EXPECT_TRUE(listeners[0].isRunning);

    auto attacks = store_.getAttacks(10, 0);
    ASSERT_TRUE(attacks.ok());
    ASSERT_EQ(attacks->size(), 1u);
    EXPECT_EQ(attacks->front().rawPayload, "USER= PASS=");
}

TEST_F(ListenerRegistryTest, DestroyingRegistryAbortsIdleSessions) {
    auto registry = std::make_unique<ListenerRegistry>(pipeline_);
    ASSERT_TRUE(registry->start(Protocol::SSH, "127.0.0.1", 0).ok());

    auto client = test::connectTo(registry->list()[0].port);
    ASSERT_TRUE(client);
    EXPECT_EQ(test::readLine(client.get()), SSHDecoy::BANNER);

    auto begin = std::chrono::steady_clock::now();
    registry.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));

    auto attacks = store_.getAttacks(10, 0);
    ASSERT_TRUE(attacks.ok());
    ASSERT_EQ(attacks->size(), 1u);
    EXPECT_EQ(attacks->front().sourceIp, "127.0.0.1");
    EXPECT_EQ(attacks->front().rawPayload, "");
}
