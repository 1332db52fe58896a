#include <gtest/gtest.h>
#include "SyncHarness.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "util/jsonHttp.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

using namespace cs;
using namespace cs::test;
using namespace cs::protocols::http;
using namespace std::chrono_literals;
using json = nlohmann::json;

class HttpServerTest : public ::testing::Test {
protected:
    SyncHarness h;
    net::io_context ioc;
    std::shared_ptr<Server> server;
    std::thread io;
    std::string base;

    void SetUp() override {
        const auto router = std::make_shared<const Router>(RouterDeps{h.validator, h.committer, h.workspaces, h.dispatcher});
        server = std::make_shared<Server>(ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, router);
        server->run();
        base = "http://127.0.0.1:" + std::to_string(server->localEndpoint().port());
        io = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        net::post(ioc, [s = server] { s->stop(); });
        EXPECT_TRUE(waitForIdle());
        ioc.stop();
        if (io.joinable()) io.join();
    }

    [[nodiscard]] util::HttpResponse send(const std::string& method, const std::string& path,
                                          const std::string& user, const std::string& body = {}) const {
        std::vector<std::string> headers;
        if (!user.empty()) headers.push_back(std::string(USER_ID_HEADER) + ": " + user);
        return util::sendJson(method, base + path, headers, body, 5s);
    }

    [[nodiscard]] bool waitForIdle() const {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (server->openSessions() > 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(10ms);
        return server->openSessions() == 0;
    }
};

TEST_F(HttpServerTest, ServesHealthCheck) {
    const auto res = send("GET", "/healthz", "");
    ASSERT_EQ(res.curl, CURLE_OK) << res.curlError();
    EXPECT_EQ(res.http, 200);
    EXPECT_EQ(json::parse(res.body).at("status"), "ok");
}

TEST_F(HttpServerTest, CreatesAndListsWorkspacesOverTheWire) {
    const auto created = send("POST", "/api/workspaces", "alice", json{{"name", "demo"}}.dump());
    ASSERT_EQ(created.curl, CURLE_OK) << created.curlError();
    ASSERT_EQ(created.http, 201);
    const auto id = json::parse(created.body).at("workspaceId").get<std::string>();

    const auto listed = send("GET", "/api/workspaces", "alice");
    ASSERT_EQ(listed.http, 200);
    const auto list = json::parse(listed.body);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].at("workspaceId"), id);

    const auto manifest = send("GET", "/api/workspaces/" + id + "/manifest", "alice");
    EXPECT_EQ(manifest.http, 200);
}

TEST_F(HttpServerTest, ErrorStatusesSurviveTransport) {
    EXPECT_EQ(send("GET", "/api/workspaces", "").http, 403);
    EXPECT_EQ(send("GET", "/api/workspaces/not-a-uuid/manifest", "alice").http, 404);
    EXPECT_EQ(send("POST", "/api/workspaces", "alice", "{not json").http, 400);
}

TEST_F(HttpServerTest, SessionsCloseAfterEachExchange) {
    for (int i = 0; i < 5; ++i) ASSERT_EQ(send("GET", "/healthz", "").http, 200);

    EXPECT_TRUE(waitForIdle());
    EXPECT_GE(server->acceptedTotal(), 5u);
}

TEST_F(HttpServerTest, StopRefusesNewConnections) {
    ASSERT_EQ(send("GET", "/healthz", "").http, 200);

    net::post(ioc, [s = server] { s->stop(); });
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    util::HttpResponse res;
    do {
        res = send("GET", "/healthz", "");
        if (res.curl != CURLE_OK) break;
        std::this_thread::sleep_for(10ms);
    } while (std::chrono::steady_clock::now() < deadline);

    EXPECT_NE(res.curl, CURLE_OK);
}

TEST(HttpServerBindTest, BusyPortIsReportedWithContext) {
    net::io_context ioc;
    const auto router = std::make_shared<const Router>(RouterDeps{});
    const auto first = std::make_shared<Server>(ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, router);
    const auto port = first->localEndpoint().port();

    // reuse_address does not permit two listeners on one port
    try {
        Server second(ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), port}, router);
        FAIL() << "second bind on port " << port << " succeeded";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(std::to_string(port)), std::string::npos);
    }
}
