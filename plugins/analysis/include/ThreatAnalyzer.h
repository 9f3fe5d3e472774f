#pragma once

#include "AttackTypes.h"
#include "IThreatAnalyzer.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace LureNet {

/**
 * @brief Stateful classifier shared by all decoys
 *
 * Keeps cumulative counts per source address, per attack type and per
 * threat level for the life of the process. Escalation is driven by one
 * counter per source address regardless of which decoy it hit.
 *
 * Thresholds on the post-increment per-source count:
 *   >= 25 CRITICAL, >= 10 HIGH, >= 3 (or any brute-force type) MEDIUM,
 *   otherwise LOW.
 */
class ThreatAnalyzer : public IThreatAnalyzer {
public:
    using Assessment = ThreatAssessment;

    struct Statistics {
        std::map<AttackType, std::uint64_t> attackCountsByType;
        std::vector<SourceCount> topAttackingIps;
        std::map<ThreatLevel, std::uint64_t> threatDistribution;
        std::uint64_t totalAttacks{0};
    };

    ThreatAnalyzer() = default;

    ThreatAnalyzer(const ThreatAnalyzer&) = delete;
    ThreatAnalyzer& operator=(const ThreatAnalyzer&) = delete;

    /**
     * @brief Count the event and classify it
     *
     * Only sourceIp and attackType are read. An empty source address is
     * counted under "unknown".
     */
    Assessment analyze(const AttackEvent& event) override;

    /// Snapshot copy; top sources ordered by count, ties by first seen
    Statistics getStatistics() const;

    /// Cumulative count for one source, 0 if never seen
    std::uint64_t historyFor(const std::string& sourceIp) const;

    /// Clear all counters. Intended for test isolation only.
    void reset();

    static ThreatLevel computeThreatLevel(std::uint64_t history, AttackType type);
    static AttackPattern detectPattern(AttackType type);
    static std::vector<std::string> buildRecommendations(ThreatLevel level,
                                                         AttackPattern pattern,
                                                         const std::string& sourceIp);

    static bool isBruteForce(AttackType type);
    static bool isReconnaissance(AttackType type);

private:
    mutable std::mutex mutex_;

    // Per-source counts in first-seen order, indexed by address.
    std::vector<SourceCount> sourceCounts_;
    std::unordered_map<std::string, std::size_t> sourceIndex_;

    std::map<AttackType, std::uint64_t> typeCounts_;
    std::map<ThreatLevel, std::uint64_t> threatCounts_;
};

} // namespace LureNet
