#pragma once

#include "sync/model/Action.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <variant>
#include <vector>

namespace pqxx {
class row;
}

namespace cs::sync::model {

// Prepared, not yet durable. Holds the action set phase 1 handed out.
struct Pending {
    std::time_t expires_at{};
    std::vector<SyncAction> actions;
};

struct Committed {
    uint64_t version{};
};

// Another reservation on the same base version was committed first.
struct Superseded {
    uint64_t by_version{};
};

using ReservationState = std::variant<Pending, Committed, Superseded>;

struct Reservation {
    std::string id;
    std::string workspace_id;
    uint64_t base_version{};
    uint64_t provisional_version{};
    std::string created_by;
    std::time_t created_at{};
    ReservationState state{Pending{}};

    Reservation() = default;

    // reservations row; Pending actions are loaded separately
    explicit Reservation(const pqxx::row& row);

    [[nodiscard]] bool isPending() const { return std::holds_alternative<Pending>(state); }
    [[nodiscard]] bool isCommitted() const { return std::holds_alternative<Committed>(state); }
    [[nodiscard]] bool isSuperseded() const { return std::holds_alternative<Superseded>(state); }

    // Only a Pending reservation can expire
    [[nodiscard]] bool isExpired(std::time_t now) const;

    [[nodiscard]] const Pending& pending() const { return std::get<Pending>(state); }
};

}
