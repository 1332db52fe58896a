#include "sync/client/SyncRound.hpp"
#include "sync/client/ConfirmCoordinator.hpp"
#include "sync/client/ServerApi.hpp"
#include "sync/client/SyncCoordinator.hpp"
#include "sync/client/UploadExecutor.hpp"
#include "sync/client/WorkspaceCache.hpp"
#include "sync/Differ.hpp"
#include "sync/Errors.hpp"
#include "execution/Client.hpp"
#include "logging/LogRegistry.hpp"

#include <unordered_map>

using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::logging;

namespace {
constexpr auto STALE_VIEW_MESSAGE = "your view is stale, reloading";
constexpr auto NOT_SAVED_MESSAGE = "changes not saved, please retry";
}

std::string cs::sync::client::to_string(const RoundState s) {
    switch (s) {
        case RoundState::Idle: return "idle";
        case RoundState::Diffing: return "diffing";
        case RoundState::Syncing: return "syncing";
        case RoundState::Uploading: return "uploading";
        case RoundState::Confirming: return "confirming";
        case RoundState::Execute: return "execute";
        case RoundState::Aborted: return "aborted";
    }
    return "unknown";
}

SyncRound::SyncRound(std::shared_ptr<ServerApi> api, std::shared_ptr<storage::BlobTransport> transport,
                     WorkspaceCache& cache, const unsigned int uploadConcurrency)
    : api_(std::move(api)), cache_(cache),
      uploads_(std::make_unique<UploadExecutor>(std::move(transport), uploadConcurrency)) {}

SyncRound::~SyncRound() = default;

void SyncRound::cancel() { uploads_->cancel(); }

void SyncRound::enter(RoundResult& r, const RoundState s) const {
    LogRegistry::client()->debug("[SyncRound] {} -> {}", to_string(r.finalState), to_string(s));
    r.finalState = s;
    r.history.push_back(s);
}

void SyncRound::abort(RoundResult& r, const std::string& userMessage, const std::string& error) const {
    LogRegistry::client()->warn("[SyncRound] Aborted in {} on workspace {}: {}",
                                to_string(r.finalState), cache_.workspaceId(), error);
    cache_.markStale();
    r.userMessage = userMessage;
    r.error = error;
    r.workspaceVersion = cache_.version();
    enter(r, RoundState::Aborted);
}

RoundResult SyncRound::run(const std::vector<ClientFileState>& local, const RoundOptions& opts) {
    RoundResult r;
    r.history.push_back(RoundState::Idle);

    const auto& ws = cache_.workspaceId();

    try {
        if (cache_.stale()) cache_.load(api_->fetchManifest(ws));

        enter(r, RoundState::Diffing);
        r.changes = Differ::diff(local, cache_.entries());
        r.workspaceVersion = cache_.version();

        if (r.changes.empty()) {
            LogRegistry::client()->info("[SyncRound] No local changes on workspace {} (version {})", ws, cache_.version());
            execute(r, opts);
            return r;
        }

        enter(r, RoundState::Syncing);
        const auto accepted = SyncCoordinator(api_).requestSync(ws, cache_.version(), r.changes);

        if (accepted.status == SyncStatus::NoChanges) {
            LogRegistry::client()->info("[SyncRound] Server reports no changes on workspace {}", ws);
            execute(r, opts);
            return r;
        }

        std::unordered_map<std::string, std::string> contents;
        for (const auto& f : local)
            if (f.kind == EntryKind::File) contents.emplace(f.filePath, f.content);

        enter(r, RoundState::Uploading);
        r.uploads = uploads_->run(accepted.actions, contents);

        enter(r, RoundState::Confirming);
        const auto finalized = ConfirmCoordinator::finalize(accepted.actions, contents);
        const auto version = ConfirmCoordinator(api_).confirm(ws, accepted, finalized);

        cache_.applyCommitted(version, finalized);
        r.workspaceVersion = version;

        execute(r, opts);
    } catch (const VersionConflict& e) {
        abort(r, STALE_VIEW_MESSAGE, e.what());
    } catch (const ConfirmRaceLost& e) {
        abort(r, STALE_VIEW_MESSAGE, e.what());
    } catch (const UploadFailure& e) {
        abort(r, NOT_SAVED_MESSAGE, e.what());
    } catch (const ValidationError& e) {
        abort(r, std::string("changes rejected: ") + e.what(), e.what());
    } catch (const std::exception& e) {
        abort(r, NOT_SAVED_MESSAGE, e.what());
    }

    return r;
}

// Execute is terminal; a failed trigger does not undo a committed round
void SyncRound::execute(RoundResult& r, const RoundOptions& opts) const {
    enter(r, RoundState::Execute);
    if (!opts.entrypoint) return;

    try {
        r.job = execution::Client(api_).execute(cache_.workspaceId(), *opts.entrypoint, opts.input);
    } catch (const std::exception& e) {
        LogRegistry::client()->error("[SyncRound] Execution request failed: {}", e.what());
        r.error = e.what();
        r.userMessage = "saved, but execution could not be started";
    }
}
