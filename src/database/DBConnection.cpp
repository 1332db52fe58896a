#include "database/DBConnection.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::logging;

namespace cs::database {

namespace {
// libpq keyword/value quoting
std::string quoteConnValue(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}
}

DBConnection::DBConnection() {
    const auto& db = config::ConfigRegistry::get().database;
    DB_CONNECTION_STR = "host=" + quoteConnValue(db.host) +
                        " port=" + std::to_string(db.port) +
                        " dbname=" + quoteConnValue(db.name) +
                        " user=" + quoteConnValue(db.user) +
                        " password=" + quoteConnValue(db.password) +
                        " options='-c TimeZone=UTC'";

    conn_ = std::make_unique<pqxx::connection>(DB_CONNECTION_STR);
    LogRegistry::db()->debug("[DBConnection] Connected to {}:{}/{}", db.host, db.port, db.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedWorkspaces();
    initPreparedManifest();
    initPreparedReservations();
}

}
