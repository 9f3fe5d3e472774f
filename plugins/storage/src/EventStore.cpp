#include "EventStore.h"
#include "Logger.h"

namespace LureNet {

EventStore::EventStore()
    : attacks_(&handler_)
    , alerts_(&handler_)
{
}

EventStore::~EventStore() {
    close();
}

lnt::Result<void> EventStore::open(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handler_.initialize(dbPath);
}

void EventStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_.shutdown();
}

bool EventStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handler_.isOpen();
}

lnt::Error EventStore::notOpen() {
    return lnt::Error{lnt::ErrorCode::DatabaseError, "Event store is not open"};
}

lnt::Result<std::int64_t> EventStore::recordAttack(const AttackEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_.isOpen()) return notOpen();

    auto id = attacks_.insert(event);
    if (id) {
        Logger::instance().log(LogLevel::DEBUG, "Recorded attack " + std::to_string(*id) +
                               " from " + event.sourceIp, "EventStore");
    }
    return id;
}

lnt::Result<std::vector<AttackEvent>> EventStore::getAttacks(int limit, int offset, const AttackFilters& filters) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_.isOpen()) return notOpen();
    return attacks_.query(limit, offset, filters);
}

lnt::Result<AttackEvent> EventStore::getAttackById(std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_.isOpen()) return notOpen();
    return attacks_.findById(id);
}

lnt::Result<AttackStatistics> EventStore::getAttackStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_.isOpen()) return notOpen();
    return attacks_.statistics();
}

lnt::Result<std::int64_t> EventStore::recordAlert(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_.isOpen()) return notOpen();

    auto id = alerts_.insert(alert);
    if (id) {
        Logger::instance().log(LogLevel::DEBUG, "Recorded alert " + std::to_string(*id) +
                               " (" + toString(alert.alertType) + ")", "EventStore");
    }
    return id;
}

lnt::Result<std::vector<Alert>> EventStore::getAlerts(int limit, int offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_.isOpen()) return notOpen();
    return alerts_.query(limit, offset);
}

} // namespace LureNet
