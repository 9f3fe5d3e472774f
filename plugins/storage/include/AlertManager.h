#pragma once

#include "AttackTypes.h"
#include "Result.h"
#include "SQLiteHandler.h"
#include <cstdint>
#include <vector>

namespace LureNet {

    /**
     * @brief Manages alerts table records.
     */
    class AlertManager {
    public:
        explicit AlertManager(SQLiteHandler* handler) : handler_(handler) {}

        lnt::Result<std::int64_t> insert(const Alert& alert);

        /// Newest-first page of alerts
        lnt::Result<std::vector<Alert>> query(int limit, int offset);

    private:
        SQLiteHandler* handler_;
    };

} // namespace LureNet
