#include <gtest/gtest.h>
#include "EventStore.h"
#include "TestSupport.h"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>

using namespace LureNet;

class EventStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        ASSERT_TRUE(store_.open(dbPath()).ok());
    }

    std::string dbPath() const { return dir_.file("honeypot.db"); }

    test::TempDir dir_;
    EventStore store_;
};

TEST_F(EventStoreTest, RecordThenFetchRoundTrip) {
    auto event = test::makeEvent("203.0.113.7", Protocol::FTP, "USER=root PASS=<toor>", ThreatLevel::HIGH);

    auto id = store_.recordAttack(event);
    ASSERT_TRUE(id.ok());

    auto fetched = store_.getAttackById(*id);
    ASSERT_TRUE(fetched.ok());

    AttackEvent expected = event;
    expected.id = *id;
    EXPECT_EQ(*fetched, expected);
    EXPECT_EQ(fetched->rawPayload, "USER=root PASS=&lt;toor&gt;");
}

TEST_F(EventStoreTest, MissingIdIsNotFound) {
    auto fetched = store_.getAttackById(9999);
    ASSERT_FALSE(fetched);
    EXPECT_EQ(fetched.error().code, lnt::ErrorCode::NotFound);
}

TEST_F(EventStoreTest, NewestFirstWithPagination) {
    std::vector<std::int64_t> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = store_.recordAttack(test::makeEvent("10.0.0." + std::to_string(i)));
        ASSERT_TRUE(id.ok());
        ids.push_back(*id);
    }

    auto page = store_.getAttacks(2, 1);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page->size(), 2u);
    EXPECT_EQ((*page)[0].id, ids[3]);
    EXPECT_EQ((*page)[1].id, ids[2]);

    auto beyond = store_.getAttacks(10, 5);
    ASSERT_TRUE(beyond.ok());
    EXPECT_TRUE(beyond->empty());
}

TEST_F(EventStoreTest, FiltersBySourceIp) {
    ASSERT_TRUE(store_.recordAttack(test::makeEvent("1.1.1.1")).ok());
    ASSERT_TRUE(store_.recordAttack(test::makeEvent("2.2.2.2")).ok());
    ASSERT_TRUE(store_.recordAttack(test::makeEvent("1.1.1.1", Protocol::HTTP)).ok());

    auto rows = store_.getAttacks(100, 0, {{"source_ip", "1.1.1.1"}});
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 2u);
    for (const auto& row : *rows) {
        EXPECT_EQ(row.sourceIp, "1.1.1.1");
    }

    auto combined = store_.getAttacks(100, 0, {{"source_ip", "1.1.1.1"}, {"protocol", "HTTP"}});
    ASSERT_TRUE(combined.ok());
    ASSERT_EQ(combined->size(), 1u);
    EXPECT_EQ(combined->front().protocol, Protocol::HTTP);
}

TEST_F(EventStoreTest, RejectsUnknownFilterColumn) {
    ASSERT_TRUE(store_.recordAttack(test::makeEvent("1.1.1.1")).ok());

    auto rows = store_.getAttacks(100, 0, {{"raw_payload; DROP TABLE attack_events;--", "x"}});
    ASSERT_FALSE(rows);
    EXPECT_EQ(rows.error().code, lnt::ErrorCode::InvalidFilter);

    auto all = store_.getAttacks();
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all->size(), 1u);
}

TEST_F(EventStoreTest, RejectsBadPagination) {
    auto zero = store_.getAttacks(0, 0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, lnt::ErrorCode::InvalidPagination);

    auto negative = store_.getAlerts(10, -1);
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code, lnt::ErrorCode::InvalidPagination);
}

TEST_F(EventStoreTest, ConcurrentWritersGetDistinctIncreasingIds) {
    constexpr int threads = 8;
    constexpr int perThread = 25;

    std::mutex idsMutex;
    std::vector<std::int64_t> ids;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < perThread; ++i) {
                auto id = store_.recordAttack(test::makeEvent("172.16.0." + std::to_string(t)));
                if (id) {
                    std::lock_guard<std::mutex> lock(idsMutex);
                    ids.push_back(*id);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_EQ(ids.size(), static_cast<size_t>(threads * perThread));
    std::set<std::int64_t> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), ids.size());

    auto rows = store_.getAttacks(threads * perThread + 10, 0);
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), ids.size());
    for (size_t i = 1; i < rows->size(); ++i) {
        EXPECT_GT(*(*rows)[i - 1].id, *(*rows)[i].id);
    }
}

TEST_F(EventStoreTest, StatisticsAggregate) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(store_.recordAttack(test::makeEvent("9.9.9.9", Protocol::SSH, "x", ThreatLevel::MEDIUM)).ok());
    }
    ASSERT_TRUE(store_.recordAttack(test::makeEvent("8.8.8.8", Protocol::HTTP, "y", ThreatLevel::LOW)).ok());
    ASSERT_TRUE(store_.recordAttack(test::makeEvent("7.7.7.7", Protocol::HTTP, "z", ThreatLevel::LOW)).ok());

    auto stats = store_.getAttackStatistics();
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats->totalAttacks, 5u);
    EXPECT_EQ(stats->uniqueAttackers, 3u);
    EXPECT_EQ(stats->attacksByType.at("SSH_BRUTE_FORCE"), 3u);
    EXPECT_EQ(stats->attacksByType.at("HTTP_PROBE"), 2u);
    EXPECT_EQ(stats->attacksByThreatLevel.at("LOW"), 2u);

    ASSERT_EQ(stats->topAttackingIps.size(), 3u);
    EXPECT_EQ(stats->topAttackingIps[0], (SourceCount{"9.9.9.9", 3}));
    // Equal counts keep first-seen order
    EXPECT_EQ(stats->topAttackingIps[1].ip, "8.8.8.8");
    EXPECT_EQ(stats->topAttackingIps[2].ip, "7.7.7.7");
}

TEST_F(EventStoreTest, AlertsRoundTripWithOptionalReference) {
    auto attackId = store_.recordAttack(test::makeEvent("5.5.5.5"));
    ASSERT_TRUE(attackId.ok());

    Alert linked;
    linked.timestamp = "2024-01-01T00:00:00.000000+00:00";
    linked.sourceIp = "5.5.5.5";
    linked.alertType = AlertType::DANGEROUS_COMMAND;
    linked.detail = "threat_level=MEDIUM attack_type=SSH_BRUTE_FORCE data=wget";
    linked.attackId = *attackId;

    Alert orphan = linked;
    orphan.alertType = AlertType::HIGH_THREAT;
    orphan.attackId = 424242;

    auto first = store_.recordAlert(linked);
    auto second = store_.recordAlert(orphan);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_GT(*second, *first);

    auto alerts = store_.getAlerts(10, 0);
    ASSERT_TRUE(alerts.ok());
    ASSERT_EQ(alerts->size(), 2u);
    EXPECT_EQ((*alerts)[0].id, *second);
    EXPECT_EQ((*alerts)[0].attackId, std::optional<std::int64_t>(424242));

    Alert expected = linked;
    expected.id = *first;
    EXPECT_EQ((*alerts)[1], expected);

    Alert unlinked = linked;
    unlinked.attackId.reset();
    auto third = store_.recordAlert(unlinked);
    ASSERT_TRUE(third.ok());
    auto latest = store_.getAlerts(1, 0);
    ASSERT_TRUE(latest.ok());
    EXPECT_FALSE(latest->front().attackId.has_value());
}

TEST_F(EventStoreTest, CommittedRowsSurviveReopen) {
    auto id = store_.recordAttack(test::makeEvent("198.51.100.1", Protocol::FTP, "USER=a PASS=b"));
    ASSERT_TRUE(id.ok());
    store_.close();
    EXPECT_FALSE(store_.isOpen());

    EventStore reopened;
    ASSERT_TRUE(reopened.open(dbPath()).ok());
    auto fetched = reopened.getAttackById(*id);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched->rawPayload, "USER=a PASS=b");

    auto next = reopened.recordAttack(test::makeEvent("198.51.100.2"));
    ASSERT_TRUE(next.ok());
    EXPECT_GT(*next, *id);
}

TEST_F(EventStoreTest, ClosedStoreRefusesCalls) {
    store_.close();

    auto id = store_.recordAttack(test::makeEvent("1.2.3.4"));
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, lnt::ErrorCode::DatabaseError);

    auto rows = store_.getAttacks();
    ASSERT_FALSE(rows);
    EXPECT_EQ(rows.error().code, lnt::ErrorCode::DatabaseError);
}

TEST(EventStoreOpenTest, UnwritableLocationFails) {
    test::quietLogs();
    test::TempDir dir;
    const std::string blocker = dir.file("not_a_dir");
    {
        std::ofstream out(blocker);
        out << "x";
    }

    EventStore store;
    auto opened = store.open(blocker + "/honeypot.db");
    EXPECT_FALSE(opened.ok());
    EXPECT_FALSE(store.isOpen());
}

TEST_F(EventStoreTest, PayloadWithEmbeddedNulSurvivesStorage) {
    const std::string binary("SSH-2.0-x\r\n\0\0\x01,\n\x14", 17);
    auto event = test::makeEvent("198.51.100.4", Protocol::SSH, binary);
    ASSERT_EQ(event.rawPayload.size(), 17u);

    auto id = store_.recordAttack(event);
    ASSERT_TRUE(id.ok());

    auto fetched = store_.getAttackById(*id);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched->rawPayload.size(), 17u);
    EXPECT_EQ(fetched->rawPayload, binary);
}

TEST_F(EventStoreTest, AlertDetailWithEmbeddedNulSurvivesStorage) {
    Alert alert;
    alert.timestamp = "2024-01-01T00:00:00.000000+00:00";
    alert.sourceIp = "198.51.100.4";
    alert.alertType = AlertType::DANGEROUS_COMMAND;
    alert.detail = std::string("data=wget\0http://x", 18);

    ASSERT_TRUE(store_.recordAlert(alert).ok());

    auto alerts = store_.getAlerts(1, 0);
    ASSERT_TRUE(alerts.ok());
    ASSERT_EQ(alerts->size(), 1u);
    EXPECT_EQ(alerts->front().detail, alert.detail);
    EXPECT_EQ(alerts->front().detail.size(), 18u);
}
