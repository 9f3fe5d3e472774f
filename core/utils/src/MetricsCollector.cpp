#include "MetricsCollector.h"
#include <sstream>

namespace LureNet {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::steady_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    CaptureMetricsSnapshot MetricsCollector::getSnapshot() const {
        CaptureMetricsSnapshot snapshot;
        snapshot.connectionsAccepted = connectionsAccepted_.load();
        snapshot.sessionsRejected = sessionsRejected_.load();
        snapshot.eventsCaptured = eventsCaptured_.load();
        snapshot.eventsPersisted = eventsPersisted_.load();
        snapshot.persistFailures = persistFailures_.load();
        snapshot.alertsRaised = alertsRaised_.load();
        snapshot.alertFailures = alertFailures_.load();
        snapshot.analyzerFailures = analyzerFailures_.load();
        snapshot.bindFailures = bindFailures_.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        auto s = getSnapshot();
        std::stringstream ss;
        ss << "uptime=" << getUptime().count() << "s"
           << " connections=" << s.connectionsAccepted
           << " rejected=" << s.sessionsRejected
           << " captured=" << s.eventsCaptured
           << " persisted=" << s.eventsPersisted
           << " persist_failures=" << s.persistFailures
           << " alerts=" << s.alertsRaised
           << " alert_failures=" << s.alertFailures
           << " analyzer_failures=" << s.analyzerFailures
           << " bind_failures=" << s.bindFailures;
        return ss.str();
    }

    void MetricsCollector::reset() {
        connectionsAccepted_ = 0;
        sessionsRejected_ = 0;
        eventsCaptured_ = 0;
        eventsPersisted_ = 0;
        persistFailures_ = 0;
        alertsRaised_ = 0;
        alertFailures_ = 0;
        analyzerFailures_ = 0;
        bindFailures_ = 0;
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

} // namespace LureNet
