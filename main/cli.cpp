#include "sync/client/LocalTree.hpp"
#include "sync/client/ServerApi.hpp"
#include "sync/client/SyncRound.hpp"
#include "sync/client/WorkspaceCache.hpp"
#include "sync/model/path.hpp"
#include "storage/BlobTransport.hpp"
#include "execution/JobStatusChannel.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace cs::config;
using namespace cs::logging;
using namespace cs::sync::client;

namespace {

constexpr auto USAGE = R"(usage: cosync [--config <path>] [--user <id>] <command> ...

commands:
  sync <workspaceId> <dir> [--run <entrypoint>] [--input <text>] [--wait]
  pull <workspaceId> <dir>
  create <name>
  list
  add-member <workspaceId> <userId> [owner|editor]
)";

struct Args {
    std::optional<std::string> config;
    std::optional<std::string> user;
    std::optional<std::string> run;
    std::optional<std::string> input;
    bool wait = false;
    std::vector<std::string> positional;
};

Args parseArgs(const int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--config") a.config = next();
        else if (arg == "--user") a.user = next();
        else if (arg == "--run") a.run = next();
        else if (arg == "--input") a.input = next();
        else if (arg == "--wait") a.wait = true;
        else if (arg.starts_with("--")) throw std::invalid_argument("unknown option " + arg);
        else a.positional.push_back(arg);
    }
    return a;
}

void initConfig(const Args& args) {
    const auto path = args.config ? std::filesystem::path(*args.config) : ConfigRegistry::defaultPath();
    if (std::filesystem::exists(path)) ConfigRegistry::init(path);
    else {
        Config cfg;
        cfg.logging.log_dir = std::filesystem::temp_directory_path() / "cosync";
        ConfigRegistry::init(cfg);
    }

    std::filesystem::create_directories(ConfigRegistry::get().logging.log_dir);
    LogRegistry::init(ConfigRegistry::get().logging.log_dir);
}

int runSync(const Args& args, const std::shared_ptr<ServerApi>& api, const ClientConfig& cfg) {
    if (args.positional.size() != 3) throw std::invalid_argument("sync needs <workspaceId> <dir>");
    const auto& ws = args.positional[1];
    const std::filesystem::path dir = args.positional[2];

    auto transport = std::make_shared<cs::storage::HttpBlobTransport>(cfg.request_timeout);
    WorkspaceCache cache(ws);
    SyncRound round(api, transport, cache, cfg.upload_concurrency);

    RoundOptions opts;
    if (args.run) opts.entrypoint = cs::sync::model::toWorkspacePath(*args.run);
    opts.input = args.input;

    const auto result = round.run(LocalTree::scan(dir), opts);

    if (!result.committed()) {
        fmt::print(stderr, "{}\n", result.userMessage.value_or("sync failed"));
        if (result.error) fmt::print(stderr, "  {}\n", *result.error);
        return EXIT_FAILURE;
    }

    fmt::print("workspace {} at version {} ({} changes)\n", ws, result.workspaceVersion, result.changes.size());

    if (!result.job) {
        if (result.userMessage) fmt::print(stderr, "{}\n", *result.userMessage);
        return opts.entrypoint ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    fmt::print("job {} started\n", result.job->jobId);
    if (!args.wait) return EXIT_SUCCESS;

    cs::execution::HttpJobStatusChannel channel(ConfigRegistry::get().execution.status_url, cfg.request_timeout);
    const auto status = cs::execution::waitFor(channel, result.job->jobId, std::chrono::milliseconds(1000),
                                               std::chrono::minutes(5));

    if (status.output) fmt::print("{}", *status.output);
    if (status.error) fmt::print(stderr, "{}", *status.error);
    return status.state == cs::execution::model::JobState::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runPull(const Args& args, const std::shared_ptr<ServerApi>& api, const ClientConfig& cfg) {
    if (args.positional.size() != 3) throw std::invalid_argument("pull needs <workspaceId> <dir>");

    cs::storage::HttpBlobTransport transport(cfg.request_timeout);
    const auto manifest = api->fetchManifest(args.positional[1]);
    const auto n = LocalTree::materialize(args.positional[2], manifest, transport);

    fmt::print("{} files at version {}\n", n, manifest.workspaceVersion);
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    try {
        const auto args = parseArgs(argc, argv);
        if (args.positional.empty()) {
            fmt::print(stderr, "{}", USAGE);
            return EXIT_FAILURE;
        }

        initConfig(args);

        auto cfg = ConfigRegistry::get().client;
        if (args.user) cfg.user_id = *args.user;
        if (cfg.user_id.empty()) throw std::invalid_argument("no user id; set client.user_id or pass --user");

        const auto api = std::make_shared<HttpServerApi>(cfg.server_url, cfg.user_id, cfg.request_timeout);
        const auto& cmd = args.positional[0];

        if (cmd == "sync") return runSync(args, api, cfg);
        if (cmd == "pull") return runPull(args, api, cfg);

        if (cmd == "create") {
            if (args.positional.size() != 2) throw std::invalid_argument("create needs <name>");
            const auto ws = api->createWorkspace(args.positional[1]);
            fmt::print("{}\n", ws.id);
            return EXIT_SUCCESS;
        }

        if (cmd == "list") {
            for (const auto& ws : api->listWorkspaces())
                fmt::print("{}  {:<8} {}\n", ws.id, ws.user_role, ws.name);
            return EXIT_SUCCESS;
        }

        if (cmd == "add-member") {
            if (args.positional.size() < 3 || args.positional.size() > 4)
                throw std::invalid_argument("add-member needs <workspaceId> <userId> [role]");
            cs::sync::model::WorkspaceMember m;
            m.user_id = args.positional[2];
            m.role = args.positional.size() == 4 ? args.positional[3] : cs::sync::model::ROLE_EDITOR;
            api->addMember(args.positional[1], m);
            return EXIT_SUCCESS;
        }

        fmt::print(stderr, "unknown command: {}\n{}", cmd, USAGE);
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "cosync: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
