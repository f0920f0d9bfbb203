#pragma once

#include "storage/Adapter.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace cairn::storage {

enum class StorageErrc {
    AlreadyExists,
    DoesNotExist,
    InvalidPath,
    DirectoryTraversal,
    InvalidDirectory
};

std::string_view to_string(StorageErrc code);

class StorageException : public std::runtime_error {
public:
    StorageException(StorageErrc code, const Adapter& adapter, const std::string& path);

    [[nodiscard]] StorageErrc code() const noexcept { return code_; }

    // The raising backend. Valid only while that adapter is alive.
    [[nodiscard]] const Adapter& adapter() const noexcept { return *adapter_; }

    [[nodiscard]] AdapterType adapterType() const noexcept { return adapterType_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    StorageErrc code_;
    const Adapter* adapter_;
    AdapterType adapterType_;
    std::string path_;
};

} // namespace cairn::storage
