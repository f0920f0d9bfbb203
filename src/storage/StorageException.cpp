#include "storage/StorageException.hpp"

#include <fmt/format.h>

namespace cairn::storage {

std::string_view to_string(const StorageErrc code) {
    switch (code) {
        case StorageErrc::AlreadyExists: return "File already exists";
        case StorageErrc::DoesNotExist: return "File does not exist";
        case StorageErrc::InvalidPath: return "Invalid path";
        case StorageErrc::DirectoryTraversal: return "Directory traversal detected";
        case StorageErrc::InvalidDirectory: return "Invalid directory";
    }
    return "Storage error";
}

std::string_view to_string(const AdapterType type) {
    switch (type) {
        case AdapterType::Local: return "local";
        case AdapterType::S3: return "s3";
    }
    return "unknown";
}

StorageException::StorageException(const StorageErrc code, const Adapter& adapter, const std::string& path)
    : std::runtime_error(fmt::format("{}: {}", to_string(code), path)),
      code_(code), adapter_(&adapter), adapterType_(adapter.type()), path_(path) {}

} // namespace cairn::storage
