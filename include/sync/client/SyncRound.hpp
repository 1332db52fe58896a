#pragma once

#include "execution/model/Job.hpp"
#include "sync/client/UploadExecutor.hpp"
#include "sync/model/Change.hpp"
#include "sync/model/Entry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cs::storage {
class BlobTransport;
}

namespace cs::sync::client {

class ServerApi;
class WorkspaceCache;

enum class RoundState { Idle, Diffing, Syncing, Uploading, Confirming, Execute, Aborted };

std::string to_string(RoundState s);

struct RoundOptions {
    std::optional<std::string> entrypoint;   // run after the round if set
    std::optional<std::string> input;
};

struct RoundResult {
    RoundState finalState{RoundState::Idle};
    std::vector<RoundState> history;
    uint64_t workspaceVersion{};                  // committed version the round ended on
    std::vector<model::SyncFileClientState> changes;
    UploadReport uploads;
    std::optional<std::string> userMessage;
    std::optional<std::string> error;
    std::optional<execution::model::ExecuteResponse> job;

    [[nodiscard]] bool committed() const { return finalState == RoundState::Execute; }
};

// One user-triggered save: diff, phase 1, uploads, phase 2, execute.
// Failures never escape; they end the round in Aborted with a message and
// leave the cache stale so the next round starts from a fresh manifest.
class SyncRound {
public:
    SyncRound(std::shared_ptr<ServerApi> api, std::shared_ptr<storage::BlobTransport> transport,
              WorkspaceCache& cache, unsigned int uploadConcurrency);
    ~SyncRound();

    RoundResult run(const std::vector<model::ClientFileState>& local, const RoundOptions& opts = {});

    // Fails the current or next round's uploads that have not started yet
    void cancel();

private:
    std::shared_ptr<ServerApi> api_;
    WorkspaceCache& cache_;
    std::unique_ptr<UploadExecutor> uploads_;

    void enter(RoundResult& r, RoundState s) const;
    void execute(RoundResult& r, const RoundOptions& opts) const;
    void abort(RoundResult& r, const std::string& userMessage, const std::string& error) const;
};

}
