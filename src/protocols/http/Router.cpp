#include "protocols/http/Router.hpp"
#include "sync/server/SyncValidator.hpp"
#include "sync/server/Committer.hpp"
#include "sync/server/WorkspaceService.hpp"
#include "execution/Dispatcher.hpp"
#include "sync/Errors.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"
#include "crypto/util/uuid.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

using namespace cs::protocols::http;
using namespace cs::sync;
using namespace cs::sync::model;
using namespace cs::util;
using namespace cs::logging;
using json = nlohmann::json;

namespace {

std::string callerOf(const request& req) {
    const auto it = req.find(USER_ID_HEADER);
    if (it == req.end()) return {};
    return std::string(it->value());
}

json parseBody(const request& req) {
    if (req.body().empty()) throw ValidationError("Request body is required");
    return json::parse(req.body());
}

}

Router::Router(RouterDeps deps) : deps_(std::move(deps)) {}

string_response Router::route(request&& req) const {
    try {
        return dispatch(req, split_path(std::string_view(req.target().data(), req.target().size())));
    } catch (const ValidationError& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    } catch (const json::exception& e) {
        return makeErrorResponse(req, std::string("Malformed request: ") + e.what(), status::bad_request);
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, std::string("Malformed request: ") + e.what(), status::bad_request);
    } catch (const NotFoundError& e) {
        return makeErrorResponse(req, e.what(), status::not_found);
    } catch (const ForbiddenError& e) {
        return makeErrorResponse(req, e.what(), status::forbidden);
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] {} {} failed: {}", std::string(req.method_string()),
                                   std::string(req.target()), e.what());
        return makeErrorResponse(req, "Internal server error", status::internal_server_error);
    }
}

string_response Router::dispatch(const request& req, const std::vector<std::string>& segments) const {
    const auto n = segments.size();
    const auto method = req.method();

    if (n == 1 && segments[0] == "healthz") {
        if (method != verb::get) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        return makeJsonResponse(req, json{{"status", "ok"}});
    }

    if (n < 2 || segments[0] != "api" || segments[1] != "workspaces")
        return makeErrorResponse(req, "Not found", status::not_found);

    const auto user = callerOf(req);
    if (user.empty()) throw ForbiddenError("Missing caller identity");

    if (n == 2) {
        if (method == verb::post) return handleCreateWorkspace(req, user);
        if (method == verb::get) return handleListWorkspaces(req, user);
        return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
    }

    const auto& ws = segments[2];

    using Handler = string_response (Router::*)(const request&, const std::string&, const std::string&) const;
    struct Route { std::string_view tail; verb method; Handler handler; };
    static constexpr Route routes[] = {
        {"sync", verb::post, &Router::handleSync},
        {"sync/confirm", verb::post, &Router::handleConfirm},
        {"manifest", verb::get, &Router::handleManifest},
        {"members", verb::post, &Router::handleAddMember},
        {"execute", verb::post, &Router::handleExecute},
    };

    std::string tail;
    for (size_t i = 3; i < n; ++i) tail += (i == 3 ? "" : "/") + segments[i];

    for (const auto& r : routes) {
        if (r.tail != tail) continue;
        if (r.method != method) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        if (!crypto::util::is_uuid(ws)) throw NotFoundError("Workspace not found: " + ws);
        return (this->*r.handler)(req, ws, user);
    }

    return makeErrorResponse(req, "Not found", status::not_found);
}

string_response Router::handleSync(const request& req, const std::string& workspaceId, const std::string& userId) const {
    const auto body = parseBody(req).get<SyncRequest>();
    const auto resp = deps_.validator->validate(workspaceId, userId, body);

    const auto s = resp.status == SyncStatus::WorkspaceConflict ? status::conflict : status::ok;
    return makeJsonResponse(req, resp, s);
}

string_response Router::handleConfirm(const request& req, const std::string& workspaceId, const std::string& userId) const {
    const auto body = parseBody(req).get<ConfirmRequest>();
    const auto resp = deps_.committer->confirm(workspaceId, userId, body);

    auto s = status::ok;
    if (resp.status == ConfirmStatus::Conflict)
        s = resp.reason == ConflictReason::ReservationExpired ? status::gone : status::conflict;
    else if (resp.status == ConfirmStatus::Error)
        s = status::internal_server_error;

    return makeJsonResponse(req, resp, s);
}

string_response Router::handleManifest(const request& req, const std::string& workspaceId, const std::string& userId) const {
    return makeJsonResponse(req, deps_.workspaces->manifest(workspaceId, userId));
}

string_response Router::handleCreateWorkspace(const request& req, const std::string& userId) const {
    const auto body = parseBody(req);
    if (!body.contains("name") || !body["name"].is_string()) throw ValidationError("name is required");

    const auto ws = deps_.workspaces->create(userId, body["name"].get<std::string>());

    const json j = {
        {"workspaceId", ws.id},
        {"name", ws.name},
        {"createdBy", ws.created_by},
        {"createdAt", timestampToString(ws.created_at)},
        {"initialVersion", ws.version}
    };
    return makeJsonResponse(req, j, status::created);
}

string_response Router::handleListWorkspaces(const request& req, const std::string& userId) const {
    return makeJsonResponse(req, deps_.workspaces->list(userId));
}

string_response Router::handleAddMember(const request& req, const std::string& workspaceId, const std::string& userId) const {
    const auto body = parseBody(req);

    WorkspaceMember m;
    m.user_id = body.at("userId").get<std::string>();
    m.role = body.value("role", std::string(ROLE_EDITOR));

    deps_.workspaces->addMember(workspaceId, userId, m);

    string_response res{status::no_content, req.version()};
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

string_response Router::handleExecute(const request& req, const std::string& workspaceId, const std::string& userId) const {
    if (!deps_.dispatcher) return makeErrorResponse(req, "Execution is not configured", status::service_unavailable);

    const auto body = parseBody(req).get<execution::model::ExecuteRequest>();
    return makeJsonResponse(req, deps_.dispatcher->dispatch(workspaceId, userId, body), status::accepted);
}

string_response Router::makeJsonResponse(const request& req, const json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::content_type, "application/json");
    res.body() = j.dump();
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status s) {
    if (s == status::internal_server_error) LogRegistry::http()->warn("[Router] {}: {}", std::string(req.target()), msg);
    else LogRegistry::http()->debug("[Router] {} -> {}: {}", std::string(req.target()), static_cast<unsigned>(s), msg);

    return makeJsonResponse(req, json{{"status", "error"}, {"errorMessage", msg}}, s);
}
