#pragma once

#include "AlertManager.h"
#include "AttackEventManager.h"
#include "AttackTypes.h"
#include "Result.h"
#include "SQLiteHandler.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace LureNet {

/**
 * @brief Durable append-only log of attack events and alerts
 *
 * Shared by every decoy session. A single mutex covers all reads and
 * writes, so ids handed out by recordAttack/recordAlert are unique and
 * strictly increasing across threads. Each write is one autocommitted
 * statement: readers never see half a row, and a write that returned
 * an id is on disk.
 */
class EventStore {
public:
    EventStore();
    ~EventStore();

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    lnt::Result<void> open(const std::string& dbPath);
    void close();
    bool isOpen() const;

    /// Persist a classified event; the id field of the argument is ignored
    lnt::Result<std::int64_t> recordAttack(const AttackEvent& event);

    /**
     * @brief Page through stored events, newest first
     * @param filters Keys limited to protocol, attack_type, source_ip, threat_level
     * @return InvalidFilter / InvalidPagination before any SQL runs
     */
    lnt::Result<std::vector<AttackEvent>> getAttacks(int limit = 100, int offset = 0,
                                                     const AttackFilters& filters = {});

    /// NotFound when absent
    lnt::Result<AttackEvent> getAttackById(std::int64_t id);

    lnt::Result<AttackStatistics> getAttackStatistics();

    lnt::Result<std::int64_t> recordAlert(const Alert& alert);
    lnt::Result<std::vector<Alert>> getAlerts(int limit = 100, int offset = 0);

private:
    mutable std::mutex mutex_;
    SQLiteHandler handler_;
    AttackEventManager attacks_;
    AlertManager alerts_;

    static lnt::Error notOpen();
};

} // namespace LureNet
