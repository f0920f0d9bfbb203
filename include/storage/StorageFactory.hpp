#pragma once

#include "storage/Storage.hpp"

#include <memory>

namespace cairn::config {
struct StorageConfig;
} // namespace cairn::config

namespace cairn::storage {

struct StorageFactory {
    static std::unique_ptr<Storage> create(const config::StorageConfig& cfg);

    // Uses the storage section of the registered configuration
    static std::unique_ptr<Storage> create();
};

} // namespace cairn::storage
