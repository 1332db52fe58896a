#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
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

namespace cs::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

// Header carrying the caller identity, set by the upstream identity layer
inline constexpr auto USER_ID_HEADER = "X-User-Id";

struct RouterDeps {
    std::shared_ptr<sync::server::SyncValidator> validator;
    std::shared_ptr<sync::server::Committer> committer;
    std::shared_ptr<sync::server::WorkspaceService> workspaces;
    std::shared_ptr<execution::Dispatcher> dispatcher;
};

// Maps the JSON API onto the sync services. Never throws: every failure
// becomes an error response.
class Router {
public:
    explicit Router(RouterDeps deps);

    string_response route(request&& req) const;

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j, status s = status::ok);

    static string_response makeErrorResponse(const request& req, const std::string& msg, status s);

private:
    RouterDeps deps_;

    string_response dispatch(const request& req, const std::vector<std::string>& segments) const;

    string_response handleSync(const request& req, const std::string& workspaceId, const std::string& userId) const;
    string_response handleConfirm(const request& req, const std::string& workspaceId, const std::string& userId) const;
    string_response handleManifest(const request& req, const std::string& workspaceId, const std::string& userId) const;
    string_response handleCreateWorkspace(const request& req, const std::string& userId) const;
    string_response handleListWorkspaces(const request& req, const std::string& userId) const;
    string_response handleAddMember(const request& req, const std::string& workspaceId, const std::string& userId) const;
    string_response handleExecute(const request& req, const std::string& workspaceId, const std::string& userId) const;
};

}
