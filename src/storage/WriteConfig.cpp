#include "storage/WriteConfig.hpp"

#include <cctype>

namespace cairn::storage {

bool parseBool(const std::string& value) {
    std::string v;
    v.reserve(value.size());
    for (const unsigned char c : value)
        if (!std::isspace(c)) v += static_cast<char>(std::tolower(c));

    return v == "true" || v == "1" || v == "yes" || v == "on";
}

WriteConfig WriteConfig::fromOptions(const std::map<std::string, std::string>& options) {
    WriteConfig cfg;
    for (const auto& [key, value] : options) {
        if (key == "overwrite") cfg.overwrite = parseBool(value);
        else cfg.metadata.emplace(key, value);
    }
    return cfg;
}

} // namespace cairn::storage
