#pragma once

#include "execution/model/Job.hpp"
#include "sync/model/Messages.hpp"
#include "sync/model/Workspace.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace cs::sync::client {

// Everything the client asks of cosyncd. Conflicts and server-side errors
// come back as response statuses; transport failures and rejected requests
// are thrown as SyncError (ValidationError for a 400).
class ServerApi {
public:
    virtual ~ServerApi() = default;

    virtual model::ManifestResponse fetchManifest(const std::string& workspaceId) = 0;

    virtual model::SyncResponse sync(const std::string& workspaceId, const model::SyncRequest& request) = 0;

    virtual model::ConfirmResponse confirm(const std::string& workspaceId, const model::ConfirmRequest& request) = 0;

    virtual execution::model::ExecuteResponse execute(const std::string& workspaceId,
                                                      const execution::model::ExecuteRequest& request) = 0;

    virtual model::WorkspaceSummary createWorkspace(const std::string& name) = 0;

    virtual std::vector<model::WorkspaceSummary> listWorkspaces() = 0;

    virtual void addMember(const std::string& workspaceId, const model::WorkspaceMember& member) = 0;
};

class HttpServerApi final : public ServerApi {
public:
    HttpServerApi(std::string serverUrl, std::string userId, std::chrono::seconds timeout);

    model::ManifestResponse fetchManifest(const std::string& workspaceId) override;
    model::SyncResponse sync(const std::string& workspaceId, const model::SyncRequest& request) override;
    model::ConfirmResponse confirm(const std::string& workspaceId, const model::ConfirmRequest& request) override;
    execution::model::ExecuteResponse execute(const std::string& workspaceId,
                                              const execution::model::ExecuteRequest& request) override;
    model::WorkspaceSummary createWorkspace(const std::string& name) override;
    std::vector<model::WorkspaceSummary> listWorkspaces() override;
    void addMember(const std::string& workspaceId, const model::WorkspaceMember& member) override;

private:
    std::string server_url_;
    std::string user_id_;
    std::chrono::seconds timeout_;

    struct Reply {
        long http;
        std::string body;
    };

    // Throws SyncError on transport failure
    Reply call(const std::string& method, const std::string& path, const std::string& body) const;

    // Maps 400 to ValidationError and any other non-2xx outside `accepted` to SyncError
    static void raiseUnlessAccepted(const Reply& reply, std::initializer_list<long> accepted);
};

}
