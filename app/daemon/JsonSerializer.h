#pragma once

#include "AttackEventManager.h"
#include "AttackTypes.h"
#include "ListenerRegistry.h"
#include "MetricsCollector.h"
#include "ThreatAnalyzer.h"
#include <json/json.h>
#include <vector>

namespace LureNet {

/**
 * @brief Read-only JSON projections of core records
 *
 * Field names are snake_case and enum values use their toString() form.
 * Absent ids and attack references are rendered as null.
 */
class JsonSerializer {
public:
    static Json::Value toJson(const AttackEvent& event);
    static Json::Value toJson(const Alert& alert);
    static Json::Value toJson(const AttackStatistics& stats);
    static Json::Value toJson(const ThreatAnalyzer::Statistics& stats);
    static Json::Value toJson(const ListenerInfo& info);
    static Json::Value toJson(const CaptureMetricsSnapshot& snapshot);

    static Json::Value toJson(const std::vector<AttackEvent>& events);
    static Json::Value toJson(const std::vector<Alert>& alerts);
    static Json::Value toJson(const std::vector<ListenerInfo>& listeners);

    /// Indented document for terminal output
    static std::string write(const Json::Value& value);

private:
    static Json::Value sourceCounts(const std::vector<SourceCount>& sources);
};

} // namespace LureNet
