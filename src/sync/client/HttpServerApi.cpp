#include "sync/client/ServerApi.hpp"
#include "sync/Errors.hpp"
#include "util/jsonHttp.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::util;
using namespace cs::logging;
using json = nlohmann::json;

namespace {

std::string errorText(const std::string& body) {
    const auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("errorMessage") && j["errorMessage"].is_string())
        return j["errorMessage"].get<std::string>();
    return body;
}

}

HttpServerApi::HttpServerApi(std::string serverUrl, std::string userId, const std::chrono::seconds timeout)
    : server_url_(std::move(serverUrl)), user_id_(std::move(userId)), timeout_(timeout) {
    while (!server_url_.empty() && server_url_.back() == '/') server_url_.pop_back();
}

HttpServerApi::Reply HttpServerApi::call(const std::string& method, const std::string& path,
                                         const std::string& body) const {
    const auto resp = sendJson(method, server_url_ + path, {"X-User-Id: " + user_id_}, body, timeout_);
    if (resp.curl != CURLE_OK) {
        LogRegistry::client()->error("[HttpServerApi] {} {} failed: {}", method, path, resp.curlError());
        throw SyncError(fmt::format("server unreachable ({})", resp.curlError()));
    }
    LogRegistry::client()->debug("[HttpServerApi] {} {} -> {}", method, path, resp.http);
    return {resp.http, resp.body};
}

void HttpServerApi::raiseUnlessAccepted(const Reply& reply, const std::initializer_list<long> accepted) {
    if (std::find(accepted.begin(), accepted.end(), reply.http) != accepted.end()) return;
    if (reply.http == 400) throw ValidationError(errorText(reply.body));
    throw SyncError(fmt::format("server returned HTTP {}: {}", reply.http, errorText(reply.body)));
}

ManifestResponse HttpServerApi::fetchManifest(const std::string& workspaceId) {
    const auto reply = call("GET", "/api/workspaces/" + workspaceId + "/manifest", "");
    raiseUnlessAccepted(reply, {200});
    return json::parse(reply.body).get<ManifestResponse>();
}

SyncResponse HttpServerApi::sync(const std::string& workspaceId, const SyncRequest& request) {
    const auto reply = call("POST", "/api/workspaces/" + workspaceId + "/sync", json(request).dump());
    raiseUnlessAccepted(reply, {200, 409});
    return json::parse(reply.body).get<SyncResponse>();
}

ConfirmResponse HttpServerApi::confirm(const std::string& workspaceId, const ConfirmRequest& request) {
    const auto reply = call("POST", "/api/workspaces/" + workspaceId + "/sync/confirm", json(request).dump());
    raiseUnlessAccepted(reply, {200, 409, 410});
    return json::parse(reply.body).get<ConfirmResponse>();
}

cs::execution::model::ExecuteResponse HttpServerApi::execute(const std::string& workspaceId,
                                                             const execution::model::ExecuteRequest& request) {
    const auto reply = call("POST", "/api/workspaces/" + workspaceId + "/execute", json(request).dump());
    raiseUnlessAccepted(reply, {200, 202});
    return json::parse(reply.body).get<execution::model::ExecuteResponse>();
}

WorkspaceSummary HttpServerApi::createWorkspace(const std::string& name) {
    const auto reply = call("POST", "/api/workspaces", json{{"name", name}}.dump());
    raiseUnlessAccepted(reply, {200, 201});

    const auto j = json::parse(reply.body);
    WorkspaceSummary s;
    j.at("workspaceId").get_to(s.id);
    j.at("name").get_to(s.name);
    j.at("createdBy").get_to(s.created_by);
    if (j.contains("createdAt")) s.created_at = parseTimestampFromString(j.at("createdAt").get<std::string>());
    s.user_role = ROLE_OWNER;
    return s;
}

std::vector<WorkspaceSummary> HttpServerApi::listWorkspaces() {
    const auto reply = call("GET", "/api/workspaces", "");
    raiseUnlessAccepted(reply, {200});
    return json::parse(reply.body).get<std::vector<WorkspaceSummary>>();
}

void HttpServerApi::addMember(const std::string& workspaceId, const WorkspaceMember& member) {
    const json body = {{"userId", member.user_id}, {"role", member.role}};
    const auto reply = call("POST", "/api/workspaces/" + workspaceId + "/members", body.dump());
    raiseUnlessAccepted(reply, {200, 204});
}
