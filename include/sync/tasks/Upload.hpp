#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Action.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace cs::storage {
class BlobTransport;
}

namespace cs::sync::tasks {

// PUTs one file's bytes to its upload capability. Resolves the promise with
// false on failure and leaves the reason in `error`.
struct Upload final : concurrency::PromisedTask {
    std::shared_ptr<storage::BlobTransport> transport;
    model::SyncAction action;
    std::string bytes;
    const std::atomic<bool>& cancelled;

    std::string error;
    std::chrono::milliseconds elapsed{};

    Upload(std::shared_ptr<storage::BlobTransport> transport,
           model::SyncAction action,
           std::string bytes,
           const std::atomic<bool>& cancelled);

    void operator()() override;
};

}
