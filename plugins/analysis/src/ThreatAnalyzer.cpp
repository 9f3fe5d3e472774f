#include "ThreatAnalyzer.h"
#include "Constants.h"
#include <algorithm>

namespace LureNet {

ThreatAnalyzer::Assessment ThreatAnalyzer::analyze(const AttackEvent& event) {
    const std::string sourceIp = event.sourceIp.empty() ? "unknown" : event.sourceIp;

    std::uint64_t history = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sourceIndex_.find(sourceIp);
        if (it == sourceIndex_.end()) {
            it = sourceIndex_.emplace(sourceIp, sourceCounts_.size()).first;
            sourceCounts_.push_back(SourceCount{sourceIp, 0});
        }
        history = ++sourceCounts_[it->second].count;
        typeCounts_[event.attackType]++;
    }

    Assessment assessment;
    assessment.threatLevel = computeThreatLevel(history, event.attackType);
    assessment.attackPattern = detectPattern(event.attackType);
    assessment.recommendations = buildRecommendations(assessment.threatLevel,
                                                      assessment.attackPattern,
                                                      sourceIp);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        threatCounts_[assessment.threatLevel]++;
    }

    return assessment;
}

ThreatAnalyzer::Statistics ThreatAnalyzer::getStatistics() const {
    Statistics stats;
    std::vector<SourceCount> sources;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.attackCountsByType = typeCounts_;
        stats.threatDistribution = threatCounts_;
        sources = sourceCounts_;
    }

    std::stable_sort(sources.begin(), sources.end(),
                     [](const SourceCount& a, const SourceCount& b) { return a.count > b.count; });
    if (sources.size() > lnt::config::TOP_SOURCE_LIMIT) {
        sources.resize(lnt::config::TOP_SOURCE_LIMIT);
    }
    stats.topAttackingIps = std::move(sources);

    for (const auto& [type, count] : stats.attackCountsByType) {
        stats.totalAttacks += count;
    }
    return stats;
}

std::uint64_t ThreatAnalyzer::historyFor(const std::string& sourceIp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sourceIndex_.find(sourceIp);
    return it == sourceIndex_.end() ? 0 : sourceCounts_[it->second].count;
}

void ThreatAnalyzer::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sourceCounts_.clear();
    sourceIndex_.clear();
    typeCounts_.clear();
    threatCounts_.clear();
}

ThreatLevel ThreatAnalyzer::computeThreatLevel(std::uint64_t history, AttackType type) {
    if (history >= lnt::config::CRITICAL_THRESHOLD) {
        return ThreatLevel::CRITICAL;
    }
    if (history >= lnt::config::HIGH_THRESHOLD) {
        return ThreatLevel::HIGH;
    }
    if (history >= lnt::config::MEDIUM_THRESHOLD || isBruteForce(type)) {
        return ThreatLevel::MEDIUM;
    }
    return ThreatLevel::LOW;
}

AttackPattern ThreatAnalyzer::detectPattern(AttackType type) {
    if (isBruteForce(type)) {
        return AttackPattern::BRUTE_FORCE;
    }
    if (isReconnaissance(type)) {
        return AttackPattern::RECONNAISSANCE;
    }
    return AttackPattern::EXPLOIT_ATTEMPT;
}

std::vector<std::string> ThreatAnalyzer::buildRecommendations(ThreatLevel level,
                                                              AttackPattern pattern,
                                                              const std::string& sourceIp) {
    std::vector<std::string> recs;
    if (isSevere(level)) {
        recs.push_back("Block IP " + sourceIp + " immediately at the firewall level.");
    }

    switch (pattern) {
        case AttackPattern::BRUTE_FORCE:
            recs.emplace_back("Enable account lockout policies and consider fail2ban.");
            recs.emplace_back("Disable password authentication and enforce SSH key-based login.");
            break;
        case AttackPattern::RECONNAISSANCE:
            recs.emplace_back("Review exposed HTTP endpoints and remove unnecessary server banners.");
            recs.emplace_back("Enable a Web Application Firewall (WAF).");
            break;
        default:
            recs.emplace_back("Investigate the source IP and review related logs.");
            break;
    }

    if (level == ThreatLevel::CRITICAL) {
        recs.emplace_back("Escalate to the incident response team.");
    }
    return recs;
}

bool ThreatAnalyzer::isBruteForce(AttackType type) {
    return type == AttackType::SSH_BRUTE_FORCE || type == AttackType::FTP_BRUTE_FORCE;
}

bool ThreatAnalyzer::isReconnaissance(AttackType type) {
    return type == AttackType::HTTP_PROBE;
}

} // namespace LureNet
