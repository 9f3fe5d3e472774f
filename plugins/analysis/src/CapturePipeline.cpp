#include "CapturePipeline.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace LureNet {

lnt::Result<AttackEvent> CapturePipeline::process(const std::string& sourceIp,
                                                  int sourcePort,
                                                  Protocol protocol,
                                                  AttackType attackType,
                                                  const std::string& capturedData) {
    auto& metrics = MetricsCollector::instance();

    auto created = AttackEvent::create(sourceIp, sourcePort, protocol, attackType, capturedData);
    if (!created) {
        LOG_ERROR_COMP("Discarding capture: " + created.error().message, "CapturePipeline");
        return created;
    }
    AttackEvent event = std::move(*created);
    metrics.incrementEventsCaptured();

    classify(event);

    auto id = store_.recordAttack(event);
    if (id) {
        event.id = *id;
        metrics.incrementEventsPersisted();
    } else {
        metrics.incrementPersistFailures();
        LOG_ERROR_COMP("Failed to persist attack from " + sourceIp + ": " + id.error().message,
                       "CapturePipeline");
    }

    alertPolicy_.apply(event);

    LOG_WARN_COMP(std::string("[") + toString(protocol) + "] Attack from " + sourceIp + ":" +
                  std::to_string(sourcePort) + " | type=" + toString(attackType) +
                  " | threat=" + toString(event.threatLevel), "CapturePipeline");
    return event;
}

void CapturePipeline::classify(AttackEvent& event) {
    try {
        auto assessment = analyzer_.analyze(event);
        event.threatLevel = assessment.threatLevel;
        event.attackPattern = assessment.attackPattern;
        LOG_DEBUG_COMP_IF(std::to_string(assessment.recommendations.size()) +
                          " recommendations for " + event.sourceIp, "CapturePipeline");
    } catch (const std::exception& e) {
        MetricsCollector::instance().incrementAnalyzerFailures();
        LOG_ERROR_COMP(std::string("Analyzer error, defaulting to LOW: ") + e.what(), "CapturePipeline");
        event.threatLevel = ThreatLevel::LOW;
        event.attackPattern = AttackPattern::UNKNOWN;
    }
}

} // namespace LureNet
