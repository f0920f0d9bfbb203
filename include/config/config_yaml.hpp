#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cairn::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<LocalStorageConfig> {
    static Node encode(const LocalStorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        return node;
    }

    static bool decode(const Node& node, LocalStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/var/lib/cairn");
        return true;
    }
};

template<>
struct convert<S3StorageConfig> {
    static Node encode(const S3StorageConfig& rhs) {
        Node node;
        node["bucket"] = rhs.bucket;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["access_key"] = rhs.access_key;
        node["secret_access_key"] = rhs.secret_access_key;
        return node;
    }

    static bool decode(const Node& node, S3StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("auto");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["driver"] = std::string(to_string(rhs.driver));
        node["local"] = rhs.local;
        node["s3"] = rhs.s3;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.driver = parseStorageDriver(node["driver"].as<std::string>("local"));
        if (const auto local = node["local"]) rhs.local = local.as<LocalStorageConfig>();
        if (const auto s3 = node["s3"]) rhs.s3 = s3.as<S3StorageConfig>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cairn"]       = to_std_string(spdlog::level::to_string_view(rhs.cairn));
        node["storage"]     = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["filesystem"]  = to_std_string(spdlog::level::to_string_view(rhs.filesystem));
        node["cloud"]       = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["config"]      = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cairn = spdlog::level::from_str(node["cairn"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.filesystem = spdlog::level::from_str(node["filesystem"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
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
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
