#include "storage/StorageFactory.hpp"
#include "storage/LocalAdapter.hpp"
#include "storage/S3Adapter.hpp"
#include "cloud/S3Controller.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace cairn::config;
using namespace cairn::logging;

namespace cairn::storage {

std::unique_ptr<Storage> StorageFactory::create(const StorageConfig& cfg) {
    switch (cfg.driver) {
        case StorageDriver::Local: {
            if (cfg.local.root.empty()) throw std::invalid_argument("Local storage requires a root directory");
            LogRegistry::cairn()->info("[StorageFactory] Local storage rooted at {}", cfg.local.root.string());
            return std::make_unique<Storage>(std::make_unique<LocalAdapter>(cfg.local.root.string()));
        }
        case StorageDriver::S3: {
            if (cfg.s3.bucket.empty()) throw std::invalid_argument("S3 storage requires a bucket");
            if (cfg.s3.endpoint.empty()) throw std::invalid_argument("S3 storage requires an endpoint");

            cloud::S3Credentials creds;
            creds.access_key = cfg.s3.access_key;
            creds.secret_access_key = cfg.s3.secret_access_key;
            creds.region = cfg.s3.region;
            creds.endpoint = cfg.s3.endpoint;

            LogRegistry::cairn()->info("[StorageFactory] S3 storage on bucket {} at {}", cfg.s3.bucket, cfg.s3.endpoint);
            auto client = std::make_shared<cloud::S3Controller>(std::move(creds));
            return std::make_unique<Storage>(std::make_unique<S3Adapter>(cfg.s3.bucket, std::move(client)));
        }
    }
    throw std::invalid_argument("Unknown storage driver");
}

std::unique_ptr<Storage> StorageFactory::create() {
    return create(ConfigRegistry::get().storage);
}

} // namespace cairn::storage
