#pragma once

#include "AlertPolicy.h"
#include "AttackTypes.h"
#include "EventStore.h"
#include "IThreatAnalyzer.h"
#include "Result.h"
#include <string>

namespace LureNet {

/**
 * @brief classify -> persist -> alert, run synchronously per session
 *
 * Services are owned elsewhere and must outlive the pipeline and every
 * decoy holding it.
 */
class CapturePipeline {
public:
    CapturePipeline(IThreatAnalyzer& analyzer, EventStore& store, AlertPolicy& alertPolicy)
        : analyzer_(analyzer)
        , store_(store)
        , alertPolicy_(alertPolicy)
    {
    }

    /**
     * @brief Record one captured session
     *
     * Analyzer and storage failures are absorbed: the classified event is
     * still returned, without an id if it could not be stored.
     *
     * @param capturedData Unescaped text read from the peer
     * @return InvalidArgument only when the source address/port is unusable
     */
    lnt::Result<AttackEvent> process(const std::string& sourceIp,
                                     int sourcePort,
                                     Protocol protocol,
                                     AttackType attackType,
                                     const std::string& capturedData);

private:
    IThreatAnalyzer& analyzer_;
    EventStore& store_;
    AlertPolicy& alertPolicy_;

    void classify(AttackEvent& event);
};

} // namespace LureNet
