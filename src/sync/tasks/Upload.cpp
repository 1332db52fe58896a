#include "sync/tasks/Upload.hpp"
#include "storage/BlobTransport.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::sync::tasks;
using namespace cs::storage;
using namespace cs::logging;

Upload::Upload(std::shared_ptr<BlobTransport> transport, model::SyncAction action, std::string bytes,
               const std::atomic<bool>& cancelled)
    : transport(std::move(transport)), action(std::move(action)), bytes(std::move(bytes)), cancelled(cancelled) {}

void Upload::operator()() {
    const auto begin = std::chrono::steady_clock::now();
    bool ok = false;

    try {
        if (cancelled.load()) error = "cancelled";
        else if (!action.uploadCapability) error = "no upload capability issued";
        else {
            transport->put(*action.uploadCapability, bytes);
            ok = true;
        }
    } catch (const std::exception& e) {
        error = e.what();
        LogRegistry::sync()->error("[UploadTask] Failed to upload file: {} - {}", action.filePath, e.what());
    }

    elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
    promise.set_value(ok);
}
