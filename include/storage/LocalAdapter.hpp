#pragma once

#include "storage/Adapter.hpp"

#include <string>
#include <vector>

namespace cairn::storage {

/**
 * Local filesystem backend confined under a root directory.
 * Every caller path is normalized first; escaping the root raises before any OS call.
 */
class LocalAdapter final : public Adapter {
public:
    explicit LocalAdapter(std::string root);
    ~LocalAdapter() override = default;

    [[nodiscard]] AdapterType type() const override { return AdapterType::Local; }

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

    [[nodiscard]] const std::string& root() const { return root_; }

    // root + "/" + normalized path, raising InvalidPath or DirectoryTraversal
    [[nodiscard]] std::string absolutePath(const std::string& path) const;

private:
    std::string root_;

    [[nodiscard]] std::vector<std::string> listing(const std::string& directory, bool recursive, bool wantDirectories) const;
};

} // namespace cairn::storage
