#pragma once

/**
 * @file AttackTypes.h
 * @brief Records shared by the decoys, the analyzer and the event store
 */

#include "Result.h"
#include <cstdint>
#include <optional>
#include <string>

namespace LureNet {

    enum class Protocol {
        SSH,
        HTTP,
        FTP
    };

    enum class AttackType {
        SSH_BRUTE_FORCE,
        HTTP_PROBE,
        FTP_BRUTE_FORCE,
        UNKNOWN
    };

    // Declaration order is severity order.
    enum class ThreatLevel {
        LOW,
        MEDIUM,
        HIGH,
        CRITICAL
    };

    enum class AttackPattern {
        BRUTE_FORCE,
        RECONNAISSANCE,
        EXPLOIT_ATTEMPT,
        UNKNOWN
    };

    enum class AlertType {
        DANGEROUS_COMMAND,
        HIGH_THREAT
    };

    const char* toString(Protocol protocol);
    const char* toString(AttackType type);
    const char* toString(ThreatLevel level);
    const char* toString(AttackPattern pattern);
    const char* toString(AlertType type);

    /// Case-insensitive ("ssh", "SSH")
    std::optional<Protocol> protocolFromString(const std::string& value);
    std::optional<AttackType> attackTypeFromString(const std::string& value);
    std::optional<ThreatLevel> threatLevelFromString(const std::string& value);
    std::optional<AttackPattern> attackPatternFromString(const std::string& value);
    std::optional<AlertType> alertTypeFromString(const std::string& value);

    /// The attack type every session of a decoy is tagged with
    AttackType attackTypeFor(Protocol protocol);

    int defaultPortFor(Protocol protocol);

    inline bool isSevere(ThreatLevel level) {
        return level == ThreatLevel::HIGH || level == ThreatLevel::CRITICAL;
    }

    /**
     * @brief One captured decoy session
     *
     * id stays empty until the event store assigns one. The payload held
     * here is already HTML-entity escaped.
     */
    struct AttackEvent {
        std::optional<std::int64_t> id;
        std::string timestamp;
        std::string sourceIp;
        int sourcePort{0};
        Protocol protocol{Protocol::SSH};
        AttackType attackType{AttackType::UNKNOWN};
        std::string rawPayload;
        ThreatLevel threatLevel{ThreatLevel::LOW};
        AttackPattern attackPattern{AttackPattern::UNKNOWN};

        /**
         * @brief Build a capture record stamped with the current UTC time
         * @param capturedData Unescaped bytes read from the peer
         * @return InvalidArgument if the source address or port is unusable
         */
        static lnt::Result<AttackEvent> create(const std::string& sourceIp,
                                               int sourcePort,
                                               Protocol protocol,
                                               AttackType attackType,
                                               const std::string& capturedData);

        bool operator==(const AttackEvent& other) const;
        bool operator!=(const AttackEvent& other) const { return !(*this == other); }
    };

    /// Source address with its attack count, used by both statistics views
    struct SourceCount {
        std::string ip;
        std::uint64_t count{0};

        bool operator==(const SourceCount& other) const {
            return ip == other.ip && count == other.count;
        }
    };

    struct Alert {
        std::optional<std::int64_t> id;
        std::string timestamp;
        std::string sourceIp;
        AlertType alertType{AlertType::HIGH_THREAT};
        std::string detail;
        std::optional<std::int64_t> attackId;

        bool operator==(const Alert& other) const;
    };

} // namespace LureNet
