#pragma once

#include "execution/model/Job.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cs::sync::client {
class ServerApi;
}

namespace cs::execution {

// Client side of the execution trigger
class Client {
public:
    explicit Client(std::shared_ptr<sync::client::ServerApi> api);

    // Language is derived from the entrypoint's extension
    model::ExecuteResponse execute(const std::string& workspaceId, const std::string& entrypointFile,
                                   const std::optional<std::string>& input = std::nullopt) const;

    // ".py" -> "python". Throws ValidationError for an unknown extension.
    static std::string languageFor(const std::string& entrypointFile);

private:
    std::shared_ptr<sync::client::ServerApi> api_;
};

}
