#pragma once

#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <utility>

namespace cs::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const size_t poolSize) { dbPool_ = std::make_shared<DBPool>(poolSize); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        Lease lease{dbPool_, dbPool_->acquire()};
        pqxx::work txn(lease.conn->get());

        try {
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
            throw;
        }
    }

  private:
    // Returns the connection to the pool on every exit path
    struct Lease {
        std::shared_ptr<DBPool> pool;
        std::unique_ptr<DBConnection> conn;
        ~Lease() { if (conn) pool->release(std::move(conn)); }
    };
};

} // namespace cs::database
