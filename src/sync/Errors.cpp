#include "sync/Errors.hpp"

namespace cs::sync {

std::string to_string(const ConflictReason r) {
    switch (r) {
        case ConflictReason::VersionMoved: return "version_moved";
        case ConflictReason::Superseded: return "superseded";
        case ConflictReason::ReservationExpired: return "reservation_expired";
        default: throw std::invalid_argument("Unknown conflict reason");
    }
}

ConflictReason conflictReasonFromString(const std::string& s) {
    if (s == "version_moved") return ConflictReason::VersionMoved;
    if (s == "superseded") return ConflictReason::Superseded;
    if (s == "reservation_expired") return ConflictReason::ReservationExpired;
    throw std::invalid_argument("Unknown conflict reason: " + s);
}

}
