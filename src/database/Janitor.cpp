#include "database/Janitor.hpp"
#include "database/WorkspaceStore.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::database;
using namespace cs::logging;

Janitor::Janitor(std::shared_ptr<WorkspaceStore> store, const std::chrono::minutes sweepInterval,
                 const std::chrono::seconds retention)
    : AsyncService("Janitor"),
      store_(std::move(store)),
      sweep_interval_(sweepInterval),
      retention_(retention) {}

Janitor::~Janitor() { stop(); }

size_t Janitor::sweep() const {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const auto removed = store_->purgeReservations(now, retention_);
    if (removed > 0) LogRegistry::db()->info("[Janitor] Purged {} reservations", removed);
    return removed;
}

void Janitor::runLoop() {
    while (!shouldStop()) {
        try {
            sweep();
        } catch (const std::exception& e) {
            LogRegistry::db()->warn("[Janitor] Failed to purge reservations: {}", e.what());
        }

        lazySleep(sweep_interval_);
    }
}
