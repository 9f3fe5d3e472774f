#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace LureNet {

    struct CaptureMetricsSnapshot {
        uint64_t connectionsAccepted{0};
        uint64_t sessionsRejected{0};
        uint64_t eventsCaptured{0};
        uint64_t eventsPersisted{0};
        uint64_t persistFailures{0};
        uint64_t alertsRaised{0};
        uint64_t alertFailures{0};
        uint64_t analyzerFailures{0};
        uint64_t bindFailures{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Listener metrics
        void incrementConnectionsAccepted() { connectionsAccepted_++; }
        void incrementSessionsRejected() { sessionsRejected_++; }
        void incrementBindFailures() { bindFailures_++; }

        // Pipeline metrics
        void incrementEventsCaptured() { eventsCaptured_++; }
        void incrementEventsPersisted() { eventsPersisted_++; }
        void incrementPersistFailures() { persistFailures_++; }
        void incrementAlertsRaised() { alertsRaised_++; }
        void incrementAlertFailures() { alertFailures_++; }
        void incrementAnalyzerFailures() { analyzerFailures_++; }

        CaptureMetricsSnapshot getSnapshot() const;

        /// One-line human readable summary for logs
        std::string getMetricsSummary() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        std::atomic<uint64_t> connectionsAccepted_{0};
        std::atomic<uint64_t> sessionsRejected_{0};
        std::atomic<uint64_t> eventsCaptured_{0};
        std::atomic<uint64_t> eventsPersisted_{0};
        std::atomic<uint64_t> persistFailures_{0};
        std::atomic<uint64_t> alertsRaised_{0};
        std::atomic<uint64_t> alertFailures_{0};
        std::atomic<uint64_t> analyzerFailures_{0};
        std::atomic<uint64_t> bindFailures_{0};

        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace LureNet
