#include "storage/Storage.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace cairn::logging;

namespace cairn::storage {

Storage::Storage(std::unique_ptr<Adapter> adapter) : adapter_(std::move(adapter)) {
    if (!adapter_) throw std::invalid_argument("Storage requires an adapter");
    LogRegistry::storage()->debug("[Storage] Using {} adapter", to_string(adapter_->type()));
}

bool Storage::append(const std::string& path, const std::string& data, const std::string& separator) {
    if (exists(path)) return write(path, read(path) + separator + data, WriteConfig::overwriting());
    return write(path, data);
}

bool Storage::prepend(const std::string& path, const std::string& data, const std::string& separator) {
    if (exists(path)) return write(path, data + separator + read(path), WriteConfig::overwriting());
    return write(path, data);
}

} // namespace cairn::storage
