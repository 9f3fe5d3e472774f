#pragma once

#include "AttackTypes.h"
#include <string>
#include <vector>

namespace LureNet {

/// Classification handed back for one event
struct ThreatAssessment {
    ThreatLevel threatLevel{ThreatLevel::LOW};
    AttackPattern attackPattern{AttackPattern::UNKNOWN};
    std::vector<std::string> recommendations;
};

/**
 * @brief Classifier seam used by the capture pipeline
 *
 * analyze() may throw; callers fall back to LOW/UNKNOWN.
 */
class IThreatAnalyzer {
public:
    virtual ~IThreatAnalyzer() = default;

    virtual ThreatAssessment analyze(const AttackEvent& event) = 0;
};

} // namespace LureNet
