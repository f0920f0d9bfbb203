#pragma once

#include "storage/WriteConfig.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::storage {

enum class AdapterType { Local, S3 };

std::string_view to_string(AdapterType type);

/**
 * Capability set every storage backend implements.
 *
 * Conflicts and path violations raise StorageException; I/O and remote
 * failures degrade to false, 0 or an empty value and are logged.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    [[nodiscard]] virtual AdapterType type() const = 0;

    [[nodiscard]] virtual bool exists(const std::string& path) const = 0;

    [[nodiscard]] virtual std::string read(const std::string& path) const = 0;

    virtual bool write(const std::string& path, const std::string& content, const WriteConfig& config = {}) = 0;

    virtual bool remove(const std::string& path) = 0;

    [[nodiscard]] virtual std::uintmax_t size(const std::string& path) const = 0;

    [[nodiscard]] virtual std::time_t lastModified(const std::string& path) const = 0;

    // Backend locator for an existing resource; raises DoesNotExist otherwise.
    [[nodiscard]] virtual std::string path(const std::string& path) const = 0;

    virtual bool copy(const std::string& from, const std::string& to) = 0;

    virtual bool move(const std::string& from, const std::string& to) = 0;

    [[nodiscard]] virtual std::vector<std::string> files(const std::string& directory, bool recursive = false) const = 0;

    [[nodiscard]] virtual std::vector<std::string> directories(const std::string& directory, bool recursive = false) const = 0;

    virtual bool createDirectory(const std::string& path) = 0;

    virtual bool deleteDirectory(const std::string& path) = 0;
};

} // namespace cairn::storage
