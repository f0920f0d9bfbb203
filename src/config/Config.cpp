#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cctype>
#include <stdexcept>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace cairn::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to load config {}: {}", path.string(), e.what()));
    }

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

StorageDriver parseStorageDriver(const std::string_view name) {
    std::string lower;
    for (const char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "local") return StorageDriver::Local;
    if (lower == "s3") return StorageDriver::S3;
    throw std::invalid_argument(fmt::format("Unknown storage driver: {}", name));
}

std::string_view to_string(const StorageDriver driver) {
    switch (driver) {
        case StorageDriver::Local: return "local";
        case StorageDriver::S3: return "s3";
    }
    return "unknown";
}

} // namespace cairn::config
