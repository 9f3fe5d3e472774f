/**
 * @file decoy_integration_test.cpp
 * @brief End-to-end tests for the SSH, HTTP and FTP decoys
 *
 * Each test binds a decoy to an ephemeral loopback port, drives it with a
 * plain TCP client and checks what reached the event store.
 */

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <chrono>
#include <map>
#include <memory>
#include <thread>

#include "FTPDecoy.h"
#include "HTTPDecoy.h"
#include "MetricsCollector.h"
#include "SSHDecoy.h"
#include "SocketGuard.h"
#include "TestSupport.h"
#include "ThreatAnalyzer.h"

using namespace LureNet;

namespace {

using test::connectTo;
using test::readLine;

void sendText(int fd, const std::string& text) {
    ASSERT_EQ(::send(fd, text.data(), text.size(), MSG_NOSIGNAL), static_cast<ssize_t>(text.size()));
}

/// Read until the peer closes (or the 5s receive timeout fires)
std::string readToEnd(int fd) {
    std::string out;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

} // namespace

class DecoyIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        ASSERT_TRUE(store_.open(dir_.file("decoys.db")).ok());
    }

    void TearDown() override {
        store_.close();
    }

    /// Poll the store until it holds the expected number of events
    std::vector<AttackEvent> waitForAttacks(size_t expected) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (true) {
            auto attacks = store_.getAttacks(100, 0);
            if (attacks && attacks->size() >= expected) {
                return *attacks;
            }
            if (std::chrono::steady_clock::now() > deadline) {
                return attacks ? *attacks : std::vector<AttackEvent>{};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    test::TempDir dir_;
    EventStore store_;
    ThreatAnalyzer analyzer_;
    AlertPolicy alertPolicy_{store_};
    CapturePipeline pipeline_{analyzer_, store_, alertPolicy_};
};

TEST_F(DecoyIntegrationTest, SSHSendsBannerAndCapturesClientVersion) {
    SSHDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());
    ASSERT_TRUE(decoy.isRunning());
    ASSERT_GT(decoy.port(), 0);

    {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        EXPECT_EQ(readLine(client.get()), SSHDecoy::BANNER);
        sendText(client.get(), "SSH-2.0-Go\r\n");
        EXPECT_EQ(readToEnd(client.get()), "");
    }

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].protocol, Protocol::SSH);
    EXPECT_EQ(attacks[0].attackType, AttackType::SSH_BRUTE_FORCE);
    EXPECT_EQ(attacks[0].rawPayload, "SSH-2.0-Go");
    EXPECT_EQ(attacks[0].sourceIp, "127.0.0.1");
    EXPECT_EQ(attacks[0].threatLevel, ThreatLevel::MEDIUM);
    EXPECT_EQ(attacks[0].attackPattern, AttackPattern::BRUTE_FORCE);

    decoy.stop();
    EXPECT_FALSE(decoy.isRunning());
}

TEST_F(DecoyIntegrationTest, SSHReadTimeoutStoresEmptyPayload) {
    DecoyOptions options;
    options.readTimeoutSec = 1;
    SSHDecoy decoy(pipeline_, options);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    auto client = connectTo(decoy.port());
    ASSERT_TRUE(client);
    EXPECT_EQ(readLine(client.get()), SSHDecoy::BANNER);
    // Say nothing and wait for the decoy to hang up
    EXPECT_EQ(readToEnd(client.get()), "");

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].rawPayload, "");
}

TEST_F(DecoyIntegrationTest, HTTPServesStockPageAndDescribesRequest) {
    HTTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        sendText(client.get(), "GET /x HTTP/1.1\r\nHost: a\r\n\r\n");
        EXPECT_EQ(readToEnd(client.get()), HTTPDecoy::fakeResponse());
    }

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].protocol, Protocol::HTTP);
    EXPECT_EQ(attacks[0].attackType, AttackType::HTTP_PROBE);
    EXPECT_EQ(attacks[0].rawPayload, "method=GET path=/x headers={Host: a}");
    EXPECT_EQ(attacks[0].threatLevel, ThreatLevel::LOW);
    EXPECT_EQ(attacks[0].attackPattern, AttackPattern::RECONNAISSANCE);
}

TEST_F(DecoyIntegrationTest, HTTPEscapesMarkupInCapturedPath) {
    HTTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        sendText(client.get(), "GET /<script> HTTP/1.0\r\n\r\n");
        readToEnd(client.get());
    }

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].rawPayload, "method=GET path=/&lt;script&gt; headers={}");
}

TEST_F(DecoyIntegrationTest, FTPLoginDialogue) {
    FTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        EXPECT_EQ(readLine(client.get()), FTPDecoy::BANNER);
        sendText(client.get(), "USER bob\r\n");
        EXPECT_EQ(readLine(client.get()), FTPDecoy::USER_OK);
        sendText(client.get(), "PASS hunter2\r\n");
        EXPECT_EQ(readLine(client.get()), FTPDecoy::PASS_FAIL);
        EXPECT_EQ(readToEnd(client.get()), "");
    }

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].protocol, Protocol::FTP);
    EXPECT_EQ(attacks[0].attackType, AttackType::FTP_BRUTE_FORCE);
    EXPECT_EQ(attacks[0].rawPayload, "USER=bob PASS=hunter2");
}

TEST_F(DecoyIntegrationTest, FTPHandlesPipelinedCommands) {
    FTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        EXPECT_EQ(readLine(client.get()), FTPDecoy::BANNER);
        sendText(client.get(), "SYST\r\nuser alice\r\npass s3cret\r\n");
        EXPECT_EQ(readToEnd(client.get()),
                  std::string(FTPDecoy::NOT_UNDERSTOOD) + FTPDecoy::USER_OK + FTPDecoy::PASS_FAIL);
    }

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].rawPayload, "USER=alice PASS=s3cret");
}

TEST_F(DecoyIntegrationTest, FTPClientDisconnectStillCaptured) {
    FTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        EXPECT_EQ(readLine(client.get()), FTPDecoy::BANNER);
        sendText(client.get(), "USER root\r\n");
        EXPECT_EQ(readLine(client.get()), FTPDecoy::USER_OK);
    }

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].rawPayload, "USER=root PASS=");
}

TEST_F(DecoyIntegrationTest, DestroyingDecoyAbortsIdleSessionAndKeepsCapture) {
    auto decoy = std::make_unique<FTPDecoy>(pipeline_);
    ASSERT_TRUE(decoy->start("127.0.0.1", 0).ok());

    auto client = connectTo(decoy->port());
    ASSERT_TRUE(client);
    EXPECT_EQ(readLine(client.get()), FTPDecoy::BANNER);
    sendText(client.get(), "USER root\r\n");
    EXPECT_EQ(readLine(client.get()), FTPDecoy::USER_OK);

    // The client stays silent; teardown must not wait out the read timeout
    auto begin = std::chrono::steady_clock::now();
    decoy.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));

    EXPECT_EQ(readToEnd(client.get()), "");
    auto attacks = store_.getAttacks(10, 0);
    ASSERT_TRUE(attacks.ok());
    ASSERT_EQ(attacks->size(), 1u);
    EXPECT_EQ(attacks->front().rawPayload, "USER=root PASS=");
}

TEST_F(DecoyIntegrationTest, OccupiedPortIsBindFailure) {
    SSHDecoy first(pipeline_);
    ASSERT_TRUE(first.start("127.0.0.1", 0).ok());

    FTPDecoy second(pipeline_);
    auto result = second.start("127.0.0.1", first.port());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, lnt::ErrorCode::BindFailed);
    EXPECT_FALSE(second.isRunning());
    EXPECT_TRUE(first.isRunning());
}

TEST_F(DecoyIntegrationTest, DoubleStartIsRejected) {
    HTTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());
    int port = decoy.port();

    auto again = decoy.start("127.0.0.1", 0);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, lnt::ErrorCode::BindFailed);
    EXPECT_TRUE(decoy.isRunning());
    EXPECT_EQ(decoy.port(), port);
}

TEST_F(DecoyIntegrationTest, StopRefusesNewConnections) {
    SSHDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());
    int port = decoy.port();

    decoy.stop();
    EXPECT_FALSE(decoy.isRunning());

    auto client = connectTo(port);
    EXPECT_FALSE(client);

    // Stopping twice is harmless
    decoy.stop();
    EXPECT_FALSE(decoy.isRunning());
}

TEST_F(DecoyIntegrationTest, SessionLimitDropsExtraConnections) {
    auto before = MetricsCollector::instance().getSnapshot().sessionsRejected;

    DecoyOptions options;
    options.readTimeoutSec = 5;
    options.maxSessions = 1;
    SSHDecoy decoy(pipeline_, options);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    auto first = connectTo(decoy.port());
    ASSERT_TRUE(first);
    EXPECT_EQ(readLine(first.get()), SSHDecoy::BANNER);

    auto second = connectTo(decoy.port());
    ASSERT_TRUE(second);
    EXPECT_EQ(readToEnd(second.get()), "");
    EXPECT_EQ(MetricsCollector::instance().getSnapshot().sessionsRejected, before + 1);

    sendText(first.get(), "SSH-2.0-first\r\n");
    first.reset();

    auto attacks = waitForAttacks(1);
    ASSERT_EQ(attacks.size(), 1u);
    EXPECT_EQ(attacks[0].rawPayload, "SSH-2.0-first");
    EXPECT_TRUE(decoy.waitForIdle(5000));
}

TEST_F(DecoyIntegrationTest, RepeatedSourceEscalatesAndAlerts) {
    HTTPDecoy decoy(pipeline_);
    ASSERT_TRUE(decoy.start("127.0.0.1", 0).ok());

    for (int i = 0; i < 10; ++i) {
        auto client = connectTo(decoy.port());
        ASSERT_TRUE(client);
        sendText(client.get(), "HEAD / HTTP/1.1\r\n\r\n");
        readToEnd(client.get());
    }

    auto attacks = waitForAttacks(10);
    ASSERT_EQ(attacks.size(), 10u);
    EXPECT_TRUE(decoy.waitForIdle(5000));

    // Sessions may finish out of order, so count levels rather than rows
    std::map<ThreatLevel, int> levels;
    std::optional<std::int64_t> highId;
    for (const auto& attack : attacks) {
        levels[attack.threatLevel]++;
        if (attack.threatLevel == ThreatLevel::HIGH) highId = attack.id;
    }
    EXPECT_EQ(levels[ThreatLevel::LOW], 2);
    EXPECT_EQ(levels[ThreatLevel::MEDIUM], 7);
    EXPECT_EQ(levels[ThreatLevel::HIGH], 1);

    auto alerts = store_.getAlerts(10, 0);
    ASSERT_TRUE(alerts.ok());
    ASSERT_EQ(alerts->size(), 1u);
    EXPECT_EQ((*alerts)[0].alertType, AlertType::HIGH_THREAT);
    EXPECT_EQ((*alerts)[0].attackId, highId);
}
