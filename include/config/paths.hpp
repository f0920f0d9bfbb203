#pragma once

#include <cstdlib>
#include <filesystem>

namespace cairn::paths {

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("CAIRN_CONFIG"); env && *env) return env;
    return "/etc/cairn/config.yaml";
}

} // namespace cairn::paths
