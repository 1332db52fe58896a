#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace cs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["execution"]) YAML::convert<ExecutionConfig>::decode(node, cfg.execution);
    if (auto node = root["client"]) YAML::convert<ClientConfig>::decode(node, cfg.client);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"server", c.server},
        {"database", c.database},
        {"storage", c.storage},
        {"sync", c.sync},
        {"execution", c.execution},
        {"client", c.client},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("server").get_to(c.server);
    j.at("database").get_to(c.database);
    j.at("storage").get_to(c.storage);
    j.at("sync").get_to(c.sync);
    j.at("execution").get_to(c.execution);
    j.at("client").get_to(c.client);
    j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"io_threads", c.io_threads}
    };
}

void from_json(const nlohmann::json& j, ServerConfig& c) {
    c.host = j.value("host", "0.0.0.0");
    c.port = j.value("port", static_cast<uint16_t>(8080));
    c.io_threads = j.value("io_threads", 4u);
}

// Password is never serialized back out
void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"pool_size", c.pool_size}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", "localhost");
    c.port = j.value("port", static_cast<uint16_t>(5432));
    c.name = j.value("name", "cosync");
    c.user = j.value("user", "cosync");
    c.password = j.value("password", "");
    c.pool_size = j.value("pool_size", 8);
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"endpoint", c.endpoint},
        {"region", c.region},
        {"bucket", c.bucket},
        {"access_key", c.access_key}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    c.endpoint = j.value("endpoint", "http://localhost:9000");
    c.region = j.value("region", "auto");
    c.bucket = j.value("bucket", "cosync");
    c.access_key = j.value("access_key", "");
    c.secret_access_key = j.value("secret_access_key", "");
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"reservation_ttl_seconds", c.reservation_ttl.count()},
        {"upload_capability_ttl_seconds", c.upload_capability_ttl.count()},
        {"download_capability_ttl_seconds", c.download_capability_ttl.count()},
        {"max_file_size_bytes", c.max_file_size_bytes},
        {"janitor_sweep_interval_minutes", c.janitor_sweep_interval.count()},
        {"reservation_retention_hours", c.reservation_retention.count()}
    };
}

void from_json(const nlohmann::json& j, SyncConfig& c) {
    c.reservation_ttl = std::chrono::seconds(j.value("reservation_ttl_seconds", 300L));
    c.upload_capability_ttl = std::chrono::seconds(j.value("upload_capability_ttl_seconds", 900L));
    c.download_capability_ttl = std::chrono::seconds(j.value("download_capability_ttl_seconds", 900L));
    c.max_file_size_bytes = j.value("max_file_size_bytes", MAX_FILE_SIZE_BYTES);
    c.janitor_sweep_interval = std::chrono::minutes(j.value("janitor_sweep_interval_minutes", 5L));
    c.reservation_retention = std::chrono::hours(j.value("reservation_retention_hours", 24L));
}

void to_json(nlohmann::json& j, const ExecutionConfig& c) {
    j = {
        {"worker_url", c.worker_url},
        {"status_url", c.status_url},
        {"supported_languages", c.supported_languages}
    };
}

void from_json(const nlohmann::json& j, ExecutionConfig& c) {
    c.worker_url = j.value("worker_url", "http://localhost:8081");
    c.status_url = j.value("status_url", c.worker_url);
    c.supported_languages = j.value("supported_languages", std::vector<std::string>{"python"});
}

void to_json(nlohmann::json& j, const ClientConfig& c) {
    j = {
        {"server_url", c.server_url},
        {"user_id", c.user_id},
        {"upload_concurrency", c.upload_concurrency},
        {"request_timeout_seconds", c.request_timeout.count()}
    };
}

void from_json(const nlohmann::json& j, ClientConfig& c) {
    c.server_url = j.value("server_url", "http://localhost:8080");
    c.user_id = j.value("user_id", "");
    c.upload_concurrency = j.value("upload_concurrency", 4u);
    c.request_timeout = std::chrono::seconds(j.value("request_timeout_seconds", 30L));
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"cosync", spdlog::level::to_string_view(c.cosync).data()},
        {"sync", spdlog::level::to_string_view(c.sync).data()},
        {"client", spdlog::level::to_string_view(c.client).data()},
        {"db", spdlog::level::to_string_view(c.db).data()},
        {"cloud", spdlog::level::to_string_view(c.cloud).data()},
        {"http", spdlog::level::to_string_view(c.http).data()},
        {"exec", spdlog::level::to_string_view(c.exec).data()}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.cosync = spdlog::level::from_str(j.value("cosync", "info"));
    c.sync = spdlog::level::from_str(j.value("sync", "info"));
    c.client = spdlog::level::from_str(j.value("client", "info"));
    c.db = spdlog::level::from_str(j.value("db", "warn"));
    c.cloud = spdlog::level::from_str(j.value("cloud", "warn"));
    c.http = spdlog::level::from_str(j.value("http", "warn"));
    c.exec = spdlog::level::from_str(j.value("exec", "info"));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", spdlog::level::to_string_view(c.console_log_level).data()},
        {"file_log_level", spdlog::level::to_string_view(c.file_log_level).data()},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "info"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "warn"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", "/var/log/cosync");
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

} // namespace cs::config
