#include "execution/Dispatcher.hpp"
#include "execution/JobQueue.hpp"
#include "database/WorkspaceStore.hpp"
#include "sync/Errors.hpp"
#include "sync/model/path.hpp"
#include "sync/server/access.hpp"
#include "crypto/util/uuid.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace cs::execution;
using namespace cs::execution::model;
using namespace cs::database;
using namespace cs::sync;
using namespace cs::logging;

Dispatcher::Dispatcher(std::shared_ptr<WorkspaceStore> store, std::shared_ptr<JobQueue> queue,
                       config::ExecutionConfig cfg, std::string bucket)
    : store_(std::move(store)), queue_(std::move(queue)), cfg_(std::move(cfg)), bucket_(std::move(bucket)) {}

ExecuteResponse Dispatcher::dispatch(const std::string& workspaceId, const std::string& userId,
                                     const ExecuteRequest& request) const {
    server::requireMember(*store_, workspaceId, userId);

    sync::model::validatePath(request.entrypointFile);

    const auto& langs = cfg_.supported_languages;
    if (std::find(langs.begin(), langs.end(), request.language) == langs.end())
        throw ValidationError("Unsupported language: " + request.language);

    const auto snap = store_->snapshot(workspaceId);

    const auto entry = std::find_if(snap.entries.begin(), snap.entries.end(), [&](const auto& e) {
        return e.filePath == request.entrypointFile;
    });
    if (entry == snap.entries.end() || !entry->isFile())
        throw ValidationError("Entrypoint is not a committed file: " + request.entrypointFile);

    WorkerPayload payload;
    payload.jobId = crypto::util::uuid4_hex();
    payload.workspaceId = workspaceId;
    payload.workspaceVersion = snap.version;
    payload.entrypointFile = request.entrypointFile;
    payload.language = request.language;
    payload.input = request.input.value_or("");
    payload.bucket = bucket_;
    for (const auto& e : snap.entries)
        if (e.isFile() && e.storageKey) payload.files.push_back({*e.storageKey, e.filePath});

    queue_->submit(payload);

    LogRegistry::exec()->info("[Dispatcher] Job {} queued for {} on workspace {} v{} ({} files)",
                              payload.jobId, request.entrypointFile, workspaceId, snap.version, payload.files.size());

    return {payload.jobId, snap.version};
}
