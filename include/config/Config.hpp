#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace cairn::config {

enum class StorageDriver { Local, S3 };

struct LocalStorageConfig {
    std::filesystem::path root = "/var/lib/cairn";
};

struct S3StorageConfig {
    std::string bucket;
    std::string endpoint;
    std::string region = "auto";
    std::string access_key;
    std::string secret_access_key;
};

struct StorageConfig {
    StorageDriver driver = StorageDriver::Local;
    LocalStorageConfig local;
    S3StorageConfig s3;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cairn      = spdlog::level::info;   // startup, wiring
    spdlog::level::level_enum storage    = spdlog::level::warn;   // rejected paths, conflicts
    spdlog::level::level_enum filesystem = spdlog::level::warn;   // local I/O failures
    spdlog::level::level_enum cloud      = spdlog::level::warn;   // S3 errors, not routine requests
    spdlog::level::level_enum config     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

StorageDriver parseStorageDriver(std::string_view name);
std::string_view to_string(StorageDriver driver);

} // namespace cairn::config
