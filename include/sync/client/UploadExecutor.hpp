#pragma once

#include "sync/model/Action.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cs::storage {
class BlobTransport;
}

namespace cs::sync::client {

// What one successful batch moved
struct UploadReport {
    size_t files{};
    uint64_t bytes{};
    std::chrono::milliseconds slowest{};
    std::string slowestPath;
};

// Moves bytes for every upload action straight to its capability, in
// parallel. The round is upload-complete only if every transfer succeeded.
class UploadExecutor {
public:
    UploadExecutor(std::shared_ptr<storage::BlobTransport> transport, unsigned int concurrency);

    // `contents` maps filePath to the bytes that were hashed in the diff.
    // Waits for every upload, then throws UploadFailure for the first failure.
    UploadReport run(const std::vector<model::SyncAction>& actions,
                     const std::unordered_map<std::string, std::string>& contents);

    // Uploads not yet started fail as cancelled. Holds until the current or
    // next run() ends, then clears.
    void cancel() { cancelled_.store(true); }

private:
    std::shared_ptr<storage::BlobTransport> transport_;
    unsigned int concurrency_;
    std::atomic<bool> cancelled_{false};

    UploadReport transfer(const std::vector<const model::SyncAction*>& pending,
                          const std::unordered_map<std::string, std::string>& contents);
};

}
