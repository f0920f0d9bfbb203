#pragma once

#include <map>
#include <string>

namespace cairn::storage {

struct WriteConfig {
    bool overwrite = false;
    std::map<std::string, std::string> metadata;   // forwarded as object headers by remote backends

    // "overwrite" is read as a boolean, every other key becomes metadata.
    static WriteConfig fromOptions(const std::map<std::string, std::string>& options);

    static WriteConfig overwriting() {
        WriteConfig cfg;
        cfg.overwrite = true;
        return cfg;
    }
};

bool parseBool(const std::string& value);

} // namespace cairn::storage
