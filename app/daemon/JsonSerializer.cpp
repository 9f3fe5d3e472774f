#include "JsonSerializer.h"

namespace LureNet {

Json::Value JsonSerializer::toJson(const AttackEvent& event) {
    Json::Value json(Json::objectValue);
    json["id"] = event.id ? Json::Value(static_cast<Json::Int64>(*event.id)) : Json::Value(Json::nullValue);
    json["timestamp"] = event.timestamp;
    json["source_ip"] = event.sourceIp;
    json["source_port"] = event.sourcePort;
    json["protocol"] = toString(event.protocol);
    json["attack_type"] = toString(event.attackType);
    json["raw_payload"] = event.rawPayload;
    json["threat_level"] = toString(event.threatLevel);
    json["attack_pattern"] = toString(event.attackPattern);
    return json;
}

Json::Value JsonSerializer::toJson(const Alert& alert) {
    Json::Value json(Json::objectValue);
    json["id"] = alert.id ? Json::Value(static_cast<Json::Int64>(*alert.id)) : Json::Value(Json::nullValue);
    json["timestamp"] = alert.timestamp;
    json["source_ip"] = alert.sourceIp;
    json["alert_type"] = toString(alert.alertType);
    json["detail"] = alert.detail;
    json["attack_id"] = alert.attackId ? Json::Value(static_cast<Json::Int64>(*alert.attackId))
                                       : Json::Value(Json::nullValue);
    return json;
}

Json::Value JsonSerializer::sourceCounts(const std::vector<SourceCount>& sources) {
    Json::Value list(Json::arrayValue);
    for (const auto& source : sources) {
        Json::Value entry(Json::objectValue);
        entry["ip"] = source.ip;
        entry["count"] = static_cast<Json::UInt64>(source.count);
        list.append(entry);
    }
    return list;
}

Json::Value JsonSerializer::toJson(const AttackStatistics& stats) {
    Json::Value json(Json::objectValue);
    json["total_attacks"] = static_cast<Json::UInt64>(stats.totalAttacks);
    json["unique_attackers"] = static_cast<Json::UInt64>(stats.uniqueAttackers);

    json["attacks_by_type"] = Json::Value(Json::objectValue);
    for (const auto& entry : stats.attacksByType) {
        json["attacks_by_type"][entry.first] = static_cast<Json::UInt64>(entry.second);
    }
    json["attacks_by_threat_level"] = Json::Value(Json::objectValue);
    for (const auto& entry : stats.attacksByThreatLevel) {
        json["attacks_by_threat_level"][entry.first] = static_cast<Json::UInt64>(entry.second);
    }

    json["top_attacking_ips"] = sourceCounts(stats.topAttackingIps);
    return json;
}

Json::Value JsonSerializer::toJson(const ThreatAnalyzer::Statistics& stats) {
    Json::Value json(Json::objectValue);
    json["total_attacks"] = static_cast<Json::UInt64>(stats.totalAttacks);

    json["attack_counts_by_type"] = Json::Value(Json::objectValue);
    for (const auto& entry : stats.attackCountsByType) {
        json["attack_counts_by_type"][toString(entry.first)] = static_cast<Json::UInt64>(entry.second);
    }
    json["threat_distribution"] = Json::Value(Json::objectValue);
    for (const auto& entry : stats.threatDistribution) {
        json["threat_distribution"][toString(entry.first)] = static_cast<Json::UInt64>(entry.second);
    }

    json["top_attacking_ips"] = sourceCounts(stats.topAttackingIps);
    return json;
}

Json::Value JsonSerializer::toJson(const ListenerInfo& info) {
    Json::Value json(Json::objectValue);
    json["protocol"] = toString(info.protocol);
    json["host"] = info.host;
    json["port"] = info.port;
    json["is_running"] = info.isRunning;
    return json;
}

Json::Value JsonSerializer::toJson(const CaptureMetricsSnapshot& snapshot) {
    Json::Value json(Json::objectValue);
    json["connections_accepted"] = static_cast<Json::UInt64>(snapshot.connectionsAccepted);
    json["sessions_rejected"] = static_cast<Json::UInt64>(snapshot.sessionsRejected);
    json["events_captured"] = static_cast<Json::UInt64>(snapshot.eventsCaptured);
    json["events_persisted"] = static_cast<Json::UInt64>(snapshot.eventsPersisted);
    json["persist_failures"] = static_cast<Json::UInt64>(snapshot.persistFailures);
    json["alerts_raised"] = static_cast<Json::UInt64>(snapshot.alertsRaised);
    json["alert_failures"] = static_cast<Json::UInt64>(snapshot.alertFailures);
    json["analyzer_failures"] = static_cast<Json::UInt64>(snapshot.analyzerFailures);
    json["bind_failures"] = static_cast<Json::UInt64>(snapshot.bindFailures);
    return json;
}

Json::Value JsonSerializer::toJson(const std::vector<AttackEvent>& events) {
    Json::Value list(Json::arrayValue);
    for (const auto& event : events) {
        list.append(toJson(event));
    }
    return list;
}

Json::Value JsonSerializer::toJson(const std::vector<Alert>& alerts) {
    Json::Value list(Json::arrayValue);
    for (const auto& alert : alerts) {
        list.append(toJson(alert));
    }
    return list;
}

Json::Value JsonSerializer::toJson(const std::vector<ListenerInfo>& listeners) {
    Json::Value list(Json::arrayValue);
    for (const auto& info : listeners) {
        list.append(toJson(info));
    }
    return list;
}

std::string JsonSerializer::write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

} // namespace LureNet
