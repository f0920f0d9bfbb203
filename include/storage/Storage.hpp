#pragma once

#include "storage/Adapter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cairn::storage {

class Storage {
public:
    explicit Storage(std::unique_ptr<Adapter> adapter);

    [[nodiscard]] bool exists(const std::string& path) const { return adapter_->exists(path); }
    [[nodiscard]] bool missing(const std::string& path) const { return !adapter_->exists(path); }

    [[nodiscard]] std::string read(const std::string& path) const { return adapter_->read(path); }

    bool write(const std::string& path, const std::string& content, const WriteConfig& config = {}) {
        return adapter_->write(path, content, config);
    }

    // Existing content is kept and `data` joined after it with `separator`.
    bool append(const std::string& path, const std::string& data, const std::string& separator = "\n");

    bool prepend(const std::string& path, const std::string& data, const std::string& separator = "\n");

    bool remove(const std::string& path) { return adapter_->remove(path); }

    [[nodiscard]] std::uintmax_t size(const std::string& path) const { return adapter_->size(path); }
    [[nodiscard]] std::time_t lastModified(const std::string& path) const { return adapter_->lastModified(path); }
    [[nodiscard]] std::string path(const std::string& path) const { return adapter_->path(path); }

    bool copy(const std::string& from, const std::string& to) { return adapter_->copy(from, to); }
    bool move(const std::string& from, const std::string& to) { return adapter_->move(from, to); }

    [[nodiscard]] std::vector<std::string> files(const std::string& directory, const bool recursive = false) const {
        return adapter_->files(directory, recursive);
    }

    [[nodiscard]] std::vector<std::string> directories(const std::string& directory, const bool recursive = false) const {
        return adapter_->directories(directory, recursive);
    }

    bool createDirectory(const std::string& path) { return adapter_->createDirectory(path); }
    bool deleteDirectory(const std::string& path) { return adapter_->deleteDirectory(path); }

    [[nodiscard]] Adapter& adapter() { return *adapter_; }
    [[nodiscard]] const Adapter& adapter() const { return *adapter_; }

private:
    std::unique_ptr<Adapter> adapter_;
};

} // namespace cairn::storage
