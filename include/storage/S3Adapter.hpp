#pragma once

#include "storage/Adapter.hpp"
#include "cloud/ObjectClient.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cairn::storage {

/**
 * Object store backend. Keys are passed to the client verbatim.
 *
 * Successful HEAD responses are cached per key (MD5 of the key) for the
 * lifetime of the adapter; a successful write or remove drops the entry.
 * The cache is not synchronized, so an instance must not be shared across
 * threads without external locking.
 */
class S3Adapter final : public Adapter {
public:
    S3Adapter(std::string bucket, std::shared_ptr<cloud::ObjectClient> client);
    ~S3Adapter() override = default;

    [[nodiscard]] AdapterType type() const override { return AdapterType::S3; }

    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] std::string read(const std::string& path) const override;
    bool write(const std::string& path, const std::string& content, const WriteConfig& config = {}) override;
    bool remove(const std::string& path) override;
    [[nodiscard]] std::uintmax_t size(const std::string& path) const override;
    [[nodiscard]] std::time_t lastModified(const std::string& path) const override;
    [[nodiscard]] std::string path(const std::string& path) const override;
    bool copy(const std::string& from, const std::string& to) override;
    bool move(const std::string& from, const std::string& to) override;
    [[nodiscard]] std::vector<std::string> files(const std::string& directory, bool recursive = false) const override;
    [[nodiscard]] std::vector<std::string> directories(const std::string& directory, bool recursive = false) const override;
    bool createDirectory(const std::string& path) override;
    bool deleteDirectory(const std::string& path) override;

    [[nodiscard]] const std::string& bucket() const { return bucket_; }

    [[nodiscard]] size_t cachedEntries() const { return cache_.size(); }

private:
    std::string bucket_;
    std::shared_ptr<cloud::ObjectClient> client_;
    mutable std::unordered_map<std::string, cloud::ObjectResponse> cache_;

    [[nodiscard]] const cloud::ObjectResponse* getMetadata(const std::string& key) const;

    [[nodiscard]] std::optional<std::string> header(const std::string& key, const std::string& name) const;

    void invalidate(const std::string& key) const;
};

} // namespace cairn::storage
