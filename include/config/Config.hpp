#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cs::config {

constexpr static uintmax_t MAX_FILE_SIZE_BYTES = static_cast<uintmax_t>(64) * 1024 * 1024; // 64MB

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    unsigned int io_threads = 4;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "cosync";
    std::string user = "cosync";
    std::string password;
    int pool_size = 8;
};

struct StorageConfig {
    std::string endpoint = "http://localhost:9000";
    std::string region = "auto";
    std::string bucket = "cosync";
    std::string access_key;
    std::string secret_access_key;
};

struct SyncConfig {
    std::chrono::seconds reservation_ttl{300};
    std::chrono::seconds upload_capability_ttl{900};
    std::chrono::seconds download_capability_ttl{900};
    uintmax_t max_file_size_bytes = MAX_FILE_SIZE_BYTES;
    std::chrono::minutes janitor_sweep_interval{5};
    std::chrono::hours reservation_retention{24};   // resolved reservations kept for replayed confirms
};

struct ExecutionConfig {
    std::string worker_url = "http://localhost:8081";
    std::string status_url = "http://localhost:8081";
    std::vector<std::string> supported_languages = {"python"};
};

struct ClientConfig {
    std::string server_url = "http://localhost:8080";
    std::string user_id;
    unsigned int upload_concurrency = 4;
    std::chrono::seconds request_timeout{30};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cosync = spdlog::level::info;   // Startup, shutdown, service lifecycle
    spdlog::level::level_enum sync   = spdlog::level::info;   // Reservations, commits, conflicts
    spdlog::level::level_enum client = spdlog::level::info;   // Round transitions on the client side
    spdlog::level::level_enum db     = spdlog::level::warn;   // Failed transactions only
    spdlog::level::level_enum cloud  = spdlog::level::warn;   // S3 errors, not routine requests
    spdlog::level::level_enum http   = spdlog::level::warn;   // 5xx, malformed requests
    spdlog::level::level_enum exec   = spdlog::level::info;   // Job dispatch and status polling
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/cosync";
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    DatabaseConfig database;
    StorageConfig storage;
    SyncConfig sync;
    ExecutionConfig execution;
    ClientConfig client;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const ServerConfig& c);
void from_json(const nlohmann::json& j, ServerConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);
void to_json(nlohmann::json& j, const ExecutionConfig& c);
void from_json(const nlohmann::json& j, ExecutionConfig& c);
void to_json(nlohmann::json& j, const ClientConfig& c);
void from_json(const nlohmann::json& j, ClientConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace cs::config
