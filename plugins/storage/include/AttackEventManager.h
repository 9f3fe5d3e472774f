#pragma once

#include "AttackTypes.h"
#include "Result.h"
#include "SQLiteHandler.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace LureNet {

    /// Column name -> required value; all entries must match
    using AttackFilters = std::map<std::string, std::string>;

    struct AttackStatistics {
        std::uint64_t totalAttacks{0};
        std::uint64_t uniqueAttackers{0};
        std::map<std::string, std::uint64_t> attacksByType;
        std::map<std::string, std::uint64_t> attacksByThreatLevel;
        std::vector<SourceCount> topAttackingIps;
    };

    /**
     * @brief Manages attack_events table records.
     *
     * Not synchronized; EventStore serializes access.
     */
    class AttackEventManager {
    public:
        explicit AttackEventManager(SQLiteHandler* handler) : handler_(handler) {}

        lnt::Result<std::int64_t> insert(const AttackEvent& event);

        /**
         * @brief Newest-first page of events
         *
         * Filter keys must be one of protocol, attack_type, source_ip,
         * threat_level; anything else is rejected before SQL is built.
         */
        lnt::Result<std::vector<AttackEvent>> query(int limit, int offset, const AttackFilters& filters);

        /// NotFound when no row has this id
        lnt::Result<AttackEvent> findById(std::int64_t id);

        lnt::Result<AttackStatistics> statistics();

        static bool isAllowedFilter(const std::string& key);

    private:
        SQLiteHandler* handler_;

        static AttackEvent readRow(sqlite3_stmt* stmt);
        lnt::Result<std::map<std::string, std::uint64_t>> groupCount(const char* sql);
    };

} // namespace LureNet
