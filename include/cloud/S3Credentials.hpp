#pragma once

#include <string>

namespace cairn::cloud {

struct S3Credentials {
    std::string access_key;
    std::string secret_access_key;
    std::string region = "auto";
    std::string endpoint;   // scheme + host, e.g. https://s3.eu-west-1.amazonaws.com

    [[nodiscard]] std::string host() const {
        const auto pos = endpoint.find("//");
        return pos == std::string::npos ? endpoint : endpoint.substr(pos + 2);
    }
};

} // namespace cairn::cloud
