#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cs::sync {

// Base for every failure a sync round can surface. Caught at the round
// boundary, never retried piecemeal.
struct SyncError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Phase 1 or phase 2 version mismatch.
struct VersionConflict : SyncError {
    uint64_t currentVersion;

    VersionConflict(const uint64_t current, const std::string& msg)
        : SyncError(msg), currentVersion(current) {}
};

// Transport or storage error while moving bytes to the blob store.
struct UploadFailure : SyncError {
    std::string filePath;

    UploadFailure(std::string path, const std::string& msg)
        : SyncError(msg), filePath(std::move(path)) {}
};

enum class ConflictReason {
    VersionMoved,
    Superseded,
    ReservationExpired
};

std::string to_string(ConflictReason r);
ConflictReason conflictReasonFromString(const std::string& s);

// The reservation presented at confirm time lost the race or ran out of time.
struct ConfirmRaceLost : SyncError {
    ConflictReason reason;
    uint64_t currentVersion;

    ConfirmRaceLost(const ConflictReason r, const uint64_t current, const std::string& msg)
        : SyncError(msg), reason(r), currentVersion(current) {}
};

// Malformed path, missing field, path/kind mismatch.
struct ValidationError : SyncError {
    using SyncError::SyncError;
};

struct NotFoundError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ForbiddenError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
