#pragma once

#include "AttackTypes.h"
#include "EventStore.h"
#include <optional>
#include <string>
#include <vector>

namespace LureNet {

/**
 * @brief Decides whether a classified event deserves an alert
 *
 * Fires on HIGH/CRITICAL events and on payloads containing a known
 * shell or network tool name (case-insensitive). The keyword path wins
 * when both apply.
 */
class AlertPolicy {
public:
    explicit AlertPolicy(EventStore& store) : store_(store) {}

    /// The alert this event would raise, without persisting it
    std::optional<Alert> evaluate(const AttackEvent& event) const;

    /**
     * @brief Evaluate and persist
     *
     * A failed write is logged and counted; the returned alert then has
     * no id. The attack row is never touched.
     */
    std::optional<Alert> apply(const AttackEvent& event);

    static bool containsDangerousKeyword(const std::string& payload);
    static const std::vector<std::string>& dangerousKeywords();

    /// "threat_level=<L> attack_type=<T> data=<first 200 chars>"
    static std::string composeDetail(const AttackEvent& event);

private:
    EventStore& store_;
};

} // namespace LureNet
