#include "sync/model/Reservation.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>

using namespace cs::sync::model;
using namespace cs::util;

Reservation::Reservation(const pqxx::row& row)
    : id(row.at("id").as<std::string>()),
      workspace_id(row.at("workspace_id").as<std::string>()),
      base_version(row.at("base_version").as<uint64_t>()),
      provisional_version(row.at("provisional_version").as<uint64_t>()),
      created_by(row.at("created_by").as<std::string>()),
      created_at(parsePostgresTimestamp(row.at("created_at").as<std::string>())) {
    const auto st = row.at("state").as<std::string>();
    if (st == "pending")
        state = Pending{ .expires_at = row.at("expires_at").as<std::time_t>(), .actions = {} };
    else if (st == "committed")
        state = Committed{ .version = row.at("resolved_version").as<uint64_t>() };
    else if (st == "superseded")
        state = Superseded{ .by_version = row.at("resolved_version").as<uint64_t>() };
    else throw std::invalid_argument("Unknown reservation state: " + st);
}

bool Reservation::isExpired(const std::time_t now) const {
    if (const auto* p = std::get_if<Pending>(&state)) return now >= p->expires_at;
    return false;
}
