#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace cs::config;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path path = std::filesystem::temp_directory_path() /
        ("cosync-config-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".yaml");

    void write(const std::string& yaml) const {
        std::ofstream out(path);
        out << yaml;
    }

    void TearDown() override { std::filesystem::remove(path); }
};

TEST_F(ConfigTest, LoadsEverySection) {
    write(R"(
server:
  host: 127.0.0.1
  port: 9090
  io_threads: 2
database:
  host: db.internal
  name: cosync_test
  pool_size: 3
storage:
  endpoint: http://minio:9000
  bucket: workspaces
sync:
  reservation_ttl_seconds: 60
  upload_capability_ttl_seconds: 120
  max_file_size_mb: 8
  reservation_retention_hours: 2
execution:
  worker_url: http://worker:8081
  supported_languages: [python, javascript]
client:
  server_url: http://cosync:9090
  user_id: alice
  upload_concurrency: 8
logging:
  log_dir: /tmp/cosync-logs
  log_levels:
    console_log_level: debug
    subsystem_levels:
      sync: trace
)");

    const auto cfg = loadConfig(path);

    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 9090);
    EXPECT_EQ(cfg.server.io_threads, 2u);
    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.port, 5432);
    EXPECT_EQ(cfg.database.pool_size, 3);
    EXPECT_EQ(cfg.storage.bucket, "workspaces");
    EXPECT_EQ(cfg.sync.reservation_ttl, std::chrono::seconds(60));
    EXPECT_EQ(cfg.sync.upload_capability_ttl, std::chrono::seconds(120));
    EXPECT_EQ(cfg.sync.download_capability_ttl, std::chrono::seconds(900));
    EXPECT_EQ(cfg.sync.max_file_size_bytes, 8u * 1024 * 1024);
    EXPECT_EQ(cfg.sync.reservation_retention, std::chrono::hours(2));
    EXPECT_EQ(cfg.execution.status_url, "http://worker:8081");
    EXPECT_EQ(cfg.execution.supported_languages, (std::vector<std::string>{"python", "javascript"}));
    EXPECT_EQ(cfg.client.user_id, "alice");
    EXPECT_EQ(cfg.client.upload_concurrency, 8u);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/cosync-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    write("server:\n  port: 8181\n");

    const auto cfg = loadConfig(path);
    const Config defaults;

    EXPECT_EQ(cfg.server.port, 8181);
    EXPECT_EQ(cfg.server.host, defaults.server.host);
    EXPECT_EQ(cfg.sync.reservation_ttl, defaults.sync.reservation_ttl);
    EXPECT_EQ(cfg.sync.max_file_size_bytes, MAX_FILE_SIZE_BYTES);
    EXPECT_EQ(cfg.execution.supported_languages, defaults.execution.supported_languages);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig(path.string() + ".absent"), std::exception);
}

TEST_F(ConfigTest, SerializesWithoutSecrets) {
    Config cfg;
    cfg.database.password = "hunter2";
    cfg.storage.secret_access_key = "s3cr3t";

    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("server").at("port"), 8080);
    EXPECT_FALSE(j.at("database").contains("password"));
    EXPECT_EQ(j.dump().find("hunter2"), std::string::npos);
    EXPECT_EQ(j.dump().find("s3cr3t"), std::string::npos);
}
