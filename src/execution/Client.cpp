#include "execution/Client.hpp"
#include "sync/client/ServerApi.hpp"
#include "sync/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <unordered_map>

using namespace cs::execution;
using namespace cs::logging;

Client::Client(std::shared_ptr<sync::client::ServerApi> api) : api_(std::move(api)) {}

std::string Client::languageFor(const std::string& entrypointFile) {
    static const std::unordered_map<std::string, std::string> byExtension = {
        {".py", "python"},
        {".js", "javascript"},
        {".ts", "typescript"},
        {".rb", "ruby"},
        {".go", "go"},
        {".java", "java"},
        {".c", "c"},
        {".cpp", "cpp"},
    };

    const auto ext = std::filesystem::path(entrypointFile).extension().string();
    const auto it = byExtension.find(ext);
    if (it == byExtension.end()) throw sync::ValidationError("Cannot infer a language for " + entrypointFile);
    return it->second;
}

model::ExecuteResponse Client::execute(const std::string& workspaceId, const std::string& entrypointFile,
                                       const std::optional<std::string>& input) const {
    model::ExecuteRequest req;
    req.entrypointFile = entrypointFile;
    req.language = languageFor(entrypointFile);
    req.input = input;

    auto resp = api_->execute(workspaceId, req);
    LogRegistry::client()->info("[ExecutionClient] Job {} started for {} at version {}",
                                resp.jobId, entrypointFile, resp.workspaceVersion);
    return resp;
}
