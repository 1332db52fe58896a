#pragma once

#include "sync/client/ServerApi.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cs::sync::server {
class SyncValidator;
class Committer;
class WorkspaceService;
}

namespace cs::execution {
class Dispatcher;
}

namespace cs::test {

// ServerApi wired straight into the server-side services for one caller
class LoopbackServerApi final : public sync::client::ServerApi {
public:
    LoopbackServerApi(std::string userId,
                      std::shared_ptr<sync::server::SyncValidator> validator,
                      std::shared_ptr<sync::server::Committer> committer,
                      std::shared_ptr<sync::server::WorkspaceService> workspaces,
                      std::shared_ptr<execution::Dispatcher> dispatcher);

    sync::model::ManifestResponse fetchManifest(const std::string& workspaceId) override;
    sync::model::SyncResponse sync(const std::string& workspaceId, const sync::model::SyncRequest& request) override;
    sync::model::ConfirmResponse confirm(const std::string& workspaceId, const sync::model::ConfirmRequest& request) override;
    execution::model::ExecuteResponse execute(const std::string& workspaceId,
                                              const execution::model::ExecuteRequest& request) override;
    sync::model::WorkspaceSummary createWorkspace(const std::string& name) override;
    std::vector<sync::model::WorkspaceSummary> listWorkspaces() override;
    void addMember(const std::string& workspaceId, const sync::model::WorkspaceMember& member) override;

    // Runs right before each confirm is forwarded
    std::function<void()> beforeConfirm;

    size_t manifestFetches = 0;
    size_t syncCalls = 0;
    size_t confirmCalls = 0;

private:
    std::string user_id_;
    std::shared_ptr<sync::server::SyncValidator> validator_;
    std::shared_ptr<sync::server::Committer> committer_;
    std::shared_ptr<sync::server::WorkspaceService> workspaces_;
    std::shared_ptr<execution::Dispatcher> dispatcher_;
};

}
