// Services
#include "sync/server/SyncValidator.hpp"
#include "sync/server/Committer.hpp"
#include "sync/server/WorkspaceService.hpp"
#include "execution/Dispatcher.hpp"
#include "execution/JobQueue.hpp"

// Database
#include "database/Transactions.hpp"
#include "database/PgWorkspaceStore.hpp"
#include "database/Janitor.hpp"
#include "database/init_db_tables.hpp"

// Storage
#include "storage/s3/S3Controller.hpp"

// Protocols
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <csignal>
#include <future>
#include <thread>
#include <vector>

using namespace cs::config;
using namespace cs::database;
using namespace cs::storage;
using namespace cs::logging;
using namespace cs::protocols;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int signum) {
    (void)signum;
    shouldExit = true;
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(argc > 1 ? std::filesystem::path(argv[1]) : ConfigRegistry::defaultPath());
        const auto& cfg = ConfigRegistry::get();
        LogRegistry::init(cfg.logging.log_dir);

        LogRegistry::cosync()->info("[*] Initializing cosyncd...");

        Transactions::init(static_cast<size_t>(cfg.database.pool_size));
        seed::init_tables();
        Transactions::dbPool_->initPreparedStatements();

        const auto store = std::make_shared<PgWorkspaceStore>();
        const auto blobs = std::make_shared<S3Controller>(cfg.storage);

        http::RouterDeps deps;
        deps.validator = std::make_shared<cs::sync::server::SyncValidator>(store, blobs, cfg.sync);
        deps.committer = std::make_shared<cs::sync::server::Committer>(store, blobs, cfg.sync);
        deps.workspaces = std::make_shared<cs::sync::server::WorkspaceService>(store, blobs, cfg.sync);
        deps.dispatcher = std::make_shared<cs::execution::Dispatcher>(
            store,
            std::make_shared<cs::execution::HttpJobQueue>(cfg.execution.worker_url, cfg.client.request_timeout),
            cfg.execution,
            cfg.storage.bucket);

        const auto router = std::make_shared<const http::Router>(std::move(deps));

        Janitor janitor(store, cfg.sync.janitor_sweep_interval,
                        std::chrono::duration_cast<std::chrono::seconds>(cfg.sync.reservation_retention));
        janitor.start();

        boost::asio::io_context ioc{static_cast<int>(std::max(1u, cfg.server.io_threads))};
        const tcp::endpoint endpoint{boost::asio::ip::make_address(cfg.server.host), cfg.server.port};
        const auto server = std::make_shared<http::Server>(ioc, endpoint, router);
        server->run();

        std::vector<std::thread> ioThreads;
        for (unsigned int i = 0; i < std::max(1u, cfg.server.io_threads); ++i)
            ioThreads.emplace_back([&ioc] { ioc.run(); });

        LogRegistry::cosync()->info("[✓] cosyncd listening on {}:{}", cfg.server.host, cfg.server.port);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

        LogRegistry::cosync()->info("[!] Shutdown signal received, stopping cosyncd...");

        // The acceptor belongs to the io threads; close it there and wait for it
        std::promise<void> closed;
        boost::asio::post(ioc, [&] { server->stop(); closed.set_value(); });
        closed.get_future().wait_for(std::chrono::seconds(5));
        ioc.stop();
        for (auto& t : ioThreads) t.join();
        janitor.stop();

        LogRegistry::cosync()->info("[✓] cosyncd shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::cosync()->error("[-] Failed to run cosyncd: {}", e.what());
        else std::fprintf(stderr, "cosyncd: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
