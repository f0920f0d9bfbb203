#include "storage/S3Adapter.hpp"
#include "storage/StorageException.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <charconv>
#include <stdexcept>
#include <utility>

using namespace cairn::cloud;
using namespace cairn::util;
using namespace cairn::logging;

namespace cairn::storage {

S3Adapter::S3Adapter(std::string bucket, std::shared_ptr<ObjectClient> client)
    : bucket_(std::move(bucket)), client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("S3Adapter requires an object client");
}

const ObjectResponse* S3Adapter::getMetadata(const std::string& key) const {
    const auto hash = md5Hex(key);
    if (const auto it = cache_.find(hash); it != cache_.end()) {
        LogRegistry::cloud()->debug("[S3Adapter] metadata cache hit for {}", key);
        return &it->second;
    }

    LogRegistry::cloud()->debug("[S3Adapter] metadata cache miss for {}", key);
    auto resp = client_->getObjectInfo(bucket_, key);
    if (resp.error || resp.code != 200) return nullptr;

    return &cache_.insert_or_assign(hash, std::move(resp)).first->second;
}

std::optional<std::string> S3Adapter::header(const std::string& key, const std::string& name) const {
    const auto* meta = getMetadata(key);
    if (!meta) return std::nullopt;
    const auto it = meta->headers.find(name);
    if (it == meta->headers.end()) return std::nullopt;
    return it->second;
}

void S3Adapter::invalidate(const std::string& key) const {
    cache_.erase(md5Hex(key));
}

bool S3Adapter::exists(const std::string& key) const {
    const auto* meta = getMetadata(key);
    return meta && meta->code == 200;
}

std::string S3Adapter::read(const std::string& key) const {
    auto resp = client_->getObject(bucket_, key);
    if (resp.error) {
        LogRegistry::cloud()->warn("[S3Adapter] read {} failed: {}", key, *resp.error);
        return {};
    }
    return std::move(resp.body);
}

bool S3Adapter::write(const std::string& key, const std::string& content, const WriteConfig& config) {
    if (exists(key) && !config.overwrite) {
        LogRegistry::storage()->debug("[S3Adapter] Refusing to overwrite {}", key);
        throw StorageException(StorageErrc::AlreadyExists, *this, key);
    }

    const auto resp = client_->putObject(bucket_, key, content, config.metadata);
    if (resp.error) {
        LogRegistry::cloud()->warn("[S3Adapter] write {} failed: {}", key, *resp.error);
        return false;
    }

    invalidate(key);
    return true;
}

bool S3Adapter::remove(const std::string& key) {
    const auto resp = client_->deleteObject(bucket_, key);
    if (resp.error) {
        LogRegistry::cloud()->warn("[S3Adapter] delete {} failed: {}", key, *resp.error);
        return false;
    }

    invalidate(key);
    return true;
}

std::uintmax_t S3Adapter::size(const std::string& key) const {
    const auto value = header(key, "content-length");
    if (!value) return 0;

    std::uintmax_t sz = 0;
    const auto* first = value->data();
    const auto* last = value->data() + value->size();
    if (const auto [ptr, ec] = std::from_chars(first, last, sz); ec != std::errc() || ptr == first) return 0;
    return sz;
}

std::time_t S3Adapter::lastModified(const std::string& key) const {
    const auto value = header(key, "last-modified");
    if (!value || value->empty()) return 0;
    return parseHttpDate(*value);
}

std::string S3Adapter::path(const std::string& key) const {
    if (!exists(key)) throw StorageException(StorageErrc::DoesNotExist, *this, key);
    return key;
}

bool S3Adapter::copy(const std::string& from, const std::string& to) {
    if (!exists(from)) return false;
    return write(to, read(from));
}

bool S3Adapter::move(const std::string& from, const std::string& to) {
    if (!exists(from)) return false;
    if (!write(to, read(from))) {
        LogRegistry::cloud()->warn("[S3Adapter] move {} -> {}: copy failed, source kept", from, to);
        return false;
    }
    return remove(from);
}

std::vector<std::string> S3Adapter::files(const std::string&, bool) const { return {}; }

std::vector<std::string> S3Adapter::directories(const std::string&, bool) const { return {}; }

bool S3Adapter::createDirectory(const std::string&) { return false; }

bool S3Adapter::deleteDirectory(const std::string&) { return false; }

} // namespace cairn::storage
