#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cs::config;

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["io_threads"] = rhs.io_threads;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(8080);
        rhs.io_threads = node["io_threads"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("cosync");
        rhs.user = node["user"].as<std::string>("cosync");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<int>(8);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["access_key"] = rhs.access_key;
        node["secret_access_key"] = rhs.secret_access_key;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("http://localhost:9000");
        rhs.region = node["region"].as<std::string>("auto");
        rhs.bucket = node["bucket"].as<std::string>("cosync");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["reservation_ttl_seconds"] = rhs.reservation_ttl.count();
        node["upload_capability_ttl_seconds"] = rhs.upload_capability_ttl.count();
        node["download_capability_ttl_seconds"] = rhs.download_capability_ttl.count();
        node["max_file_size_mb"] = rhs.max_file_size_bytes / (1024 * 1024);
        node["janitor_sweep_interval_minutes"] = rhs.janitor_sweep_interval.count();
        node["reservation_retention_hours"] = rhs.reservation_retention.count();
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.reservation_ttl = std::chrono::seconds(node["reservation_ttl_seconds"].as<long>(300));
        rhs.upload_capability_ttl = std::chrono::seconds(node["upload_capability_ttl_seconds"].as<long>(900));
        rhs.download_capability_ttl = std::chrono::seconds(node["download_capability_ttl_seconds"].as<long>(900));
        rhs.max_file_size_bytes = node["max_file_size_mb"].as<uintmax_t>(64) * 1024 * 1024; // Default 64MB
        rhs.janitor_sweep_interval = std::chrono::minutes(node["janitor_sweep_interval_minutes"].as<long>(5));
        rhs.reservation_retention = std::chrono::hours(node["reservation_retention_hours"].as<long>(24));
        return true;
    }
};

template<>
struct convert<ExecutionConfig> {
    static Node encode(const ExecutionConfig& rhs) {
        Node node;
        node["worker_url"] = rhs.worker_url;
        node["status_url"] = rhs.status_url;
        node["supported_languages"] = rhs.supported_languages;
        return node;
    }

    static bool decode(const Node& node, ExecutionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker_url = node["worker_url"].as<std::string>("http://localhost:8081");
        rhs.status_url = node["status_url"].as<std::string>(rhs.worker_url);
        if (node["supported_languages"])
            rhs.supported_languages = node["supported_languages"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<ClientConfig> {
    static Node encode(const ClientConfig& rhs) {
        Node node;
        node["server_url"] = rhs.server_url;
        node["user_id"] = rhs.user_id;
        node["upload_concurrency"] = rhs.upload_concurrency;
        node["request_timeout_seconds"] = rhs.request_timeout.count();
        return node;
    }

    static bool decode(const Node& node, ClientConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.server_url = node["server_url"].as<std::string>("http://localhost:8080");
        rhs.user_id = node["user_id"].as<std::string>("");
        rhs.upload_concurrency = node["upload_concurrency"].as<unsigned int>(4);
        rhs.request_timeout = std::chrono::seconds(node["request_timeout_seconds"].as<long>(30));
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cosync"] = to_std_string(spdlog::level::to_string_view(rhs.cosync));
        node["sync"]   = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["client"] = to_std_string(spdlog::level::to_string_view(rhs.client));
        node["db"]     = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["cloud"]  = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["http"]   = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["exec"]   = to_std_string(spdlog::level::to_string_view(rhs.exec));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cosync = spdlog::level::from_str(node["cosync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.client = spdlog::level::from_str(node["client"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.exec = spdlog::level::from_str(node["exec"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/cosync");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
