#include "AlertPolicy.h"
#include "Constants.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "TextUtils.h"

namespace LureNet {

const std::vector<std::string>& AlertPolicy::dangerousKeywords() {
    static const std::vector<std::string> keywords = {
        "wget", "curl", "chmod", "rm -rf", "bash", "nc ", "python", "perl"
    };
    return keywords;
}

bool AlertPolicy::containsDangerousKeyword(const std::string& payload) {
    for (const auto& keyword : dangerousKeywords()) {
        if (TextUtils::containsIgnoreCase(payload, keyword)) {
            return true;
        }
    }
    return false;
}

std::string AlertPolicy::composeDetail(const AttackEvent& event) {
    return std::string("threat_level=") + toString(event.threatLevel) +
           " attack_type=" + toString(event.attackType) +
           " data=" + TextUtils::truncate(event.rawPayload, lnt::config::ALERT_DETAIL_PAYLOAD_CHARS);
}

std::optional<Alert> AlertPolicy::evaluate(const AttackEvent& event) const {
    bool dangerous = containsDangerousKeyword(event.rawPayload);
    if (!dangerous && !isSevere(event.threatLevel)) {
        return std::nullopt;
    }

    Alert alert;
    alert.timestamp = event.timestamp;
    alert.sourceIp = event.sourceIp;
    alert.alertType = dangerous ? AlertType::DANGEROUS_COMMAND : AlertType::HIGH_THREAT;
    alert.detail = composeDetail(event);
    alert.attackId = event.id;
    return alert;
}

std::optional<Alert> AlertPolicy::apply(const AttackEvent& event) {
    auto alert = evaluate(event);
    if (!alert) {
        return std::nullopt;
    }

    auto& metrics = MetricsCollector::instance();
    auto id = store_.recordAlert(*alert);
    if (id) {
        alert->id = *id;
        metrics.incrementAlertsRaised();
        Logger::instance().log(LogLevel::WARN, std::string("ALERT ") + toString(alert->alertType) +
                               " from " + alert->sourceIp + ": " + alert->detail, "AlertPolicy");
    } else {
        metrics.incrementAlertFailures();
        Logger::instance().log(LogLevel::ERROR, "Failed to record alert for " + alert->sourceIp +
                               ": " + id.error().message, "AlertPolicy");
    }
    return alert;
}

} // namespace LureNet
