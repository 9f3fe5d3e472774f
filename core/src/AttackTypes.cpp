#include "AttackTypes.h"
#include "Constants.h"
#include "TextUtils.h"
#include "TimeUtils.h"

namespace LureNet {

const char* toString(Protocol protocol) {
    switch (protocol) {
        case Protocol::SSH: return "SSH";
        case Protocol::HTTP: return "HTTP";
        case Protocol::FTP: return "FTP";
        default: return "UNKNOWN";
    }
}

const char* toString(AttackType type) {
    switch (type) {
        case AttackType::SSH_BRUTE_FORCE: return "SSH_BRUTE_FORCE";
        case AttackType::HTTP_PROBE: return "HTTP_PROBE";
        case AttackType::FTP_BRUTE_FORCE: return "FTP_BRUTE_FORCE";
        default: return "UNKNOWN";
    }
}

const char* toString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::LOW: return "LOW";
        case ThreatLevel::MEDIUM: return "MEDIUM";
        case ThreatLevel::HIGH: return "HIGH";
        case ThreatLevel::CRITICAL: return "CRITICAL";
        default: return "LOW";
    }
}

const char* toString(AttackPattern pattern) {
    switch (pattern) {
        case AttackPattern::BRUTE_FORCE: return "BRUTE_FORCE";
        case AttackPattern::RECONNAISSANCE: return "RECONNAISSANCE";
        case AttackPattern::EXPLOIT_ATTEMPT: return "EXPLOIT_ATTEMPT";
        default: return "UNKNOWN";
    }
}

const char* toString(AlertType type) {
    switch (type) {
        case AlertType::DANGEROUS_COMMAND: return "DANGEROUS_COMMAND";
        case AlertType::HIGH_THREAT: return "HIGH_THREAT";
        default: return "HIGH_THREAT";
    }
}

std::optional<Protocol> protocolFromString(const std::string& value) {
    std::string upper = TextUtils::toUpper(TextUtils::trim(value));
    if (upper == "SSH") return Protocol::SSH;
    if (upper == "HTTP") return Protocol::HTTP;
    if (upper == "FTP") return Protocol::FTP;
    return std::nullopt;
}

std::optional<AttackType> attackTypeFromString(const std::string& value) {
    std::string upper = TextUtils::toUpper(TextUtils::trim(value));
    if (upper == "SSH_BRUTE_FORCE") return AttackType::SSH_BRUTE_FORCE;
    if (upper == "HTTP_PROBE") return AttackType::HTTP_PROBE;
    if (upper == "FTP_BRUTE_FORCE") return AttackType::FTP_BRUTE_FORCE;
    if (upper == "UNKNOWN") return AttackType::UNKNOWN;
    return std::nullopt;
}

std::optional<ThreatLevel> threatLevelFromString(const std::string& value) {
    std::string upper = TextUtils::toUpper(TextUtils::trim(value));
    if (upper == "LOW") return ThreatLevel::LOW;
    if (upper == "MEDIUM") return ThreatLevel::MEDIUM;
    if (upper == "HIGH") return ThreatLevel::HIGH;
    if (upper == "CRITICAL") return ThreatLevel::CRITICAL;
    return std::nullopt;
}

std::optional<AttackPattern> attackPatternFromString(const std::string& value) {
    std::string upper = TextUtils::toUpper(TextUtils::trim(value));
    if (upper == "BRUTE_FORCE") return AttackPattern::BRUTE_FORCE;
    if (upper == "RECONNAISSANCE") return AttackPattern::RECONNAISSANCE;
    if (upper == "EXPLOIT_ATTEMPT") return AttackPattern::EXPLOIT_ATTEMPT;
    if (upper == "UNKNOWN") return AttackPattern::UNKNOWN;
    return std::nullopt;
}

std::optional<AlertType> alertTypeFromString(const std::string& value) {
    std::string upper = TextUtils::toUpper(TextUtils::trim(value));
    if (upper == "DANGEROUS_COMMAND") return AlertType::DANGEROUS_COMMAND;
    if (upper == "HIGH_THREAT") return AlertType::HIGH_THREAT;
    return std::nullopt;
}

AttackType attackTypeFor(Protocol protocol) {
    switch (protocol) {
        case Protocol::SSH: return AttackType::SSH_BRUTE_FORCE;
        case Protocol::HTTP: return AttackType::HTTP_PROBE;
        case Protocol::FTP: return AttackType::FTP_BRUTE_FORCE;
        default: return AttackType::UNKNOWN;
    }
}

int defaultPortFor(Protocol protocol) {
    switch (protocol) {
        case Protocol::SSH: return lnt::config::DEFAULT_SSH_PORT;
        case Protocol::HTTP: return lnt::config::DEFAULT_HTTP_PORT;
        case Protocol::FTP: return lnt::config::DEFAULT_FTP_PORT;
        default: return 0;
    }
}

lnt::Result<AttackEvent> AttackEvent::create(const std::string& sourceIp,
                                             int sourcePort,
                                             Protocol protocol,
                                             AttackType attackType,
                                             const std::string& capturedData) {
    if (sourceIp.empty()) {
        return lnt::Err<AttackEvent>(lnt::ErrorCode::InvalidArgument, "Source IP is empty");
    }
    if (sourcePort < 0 || sourcePort > 65535) {
        return lnt::Err<AttackEvent>(lnt::ErrorCode::InvalidArgument,
                                     "Source port out of range: " + std::to_string(sourcePort));
    }

    AttackEvent event;
    event.timestamp = TimeUtils::nowIso8601();
    event.sourceIp = sourceIp;
    event.sourcePort = sourcePort;
    event.protocol = protocol;
    event.attackType = attackType;
    event.rawPayload = TextUtils::sanitizeHtml(TextUtils::sanitizeUtf8(capturedData));
    return event;
}

bool AttackEvent::operator==(const AttackEvent& other) const {
    return id == other.id &&
           timestamp == other.timestamp &&
           sourceIp == other.sourceIp &&
           sourcePort == other.sourcePort &&
           protocol == other.protocol &&
           attackType == other.attackType &&
           rawPayload == other.rawPayload &&
           threatLevel == other.threatLevel &&
           attackPattern == other.attackPattern;
}

bool Alert::operator==(const Alert& other) const {
    return id == other.id &&
           timestamp == other.timestamp &&
           sourceIp == other.sourceIp &&
           alertType == other.alertType &&
           detail == other.detail &&
           attackId == other.attackId;
}

} // namespace LureNet
