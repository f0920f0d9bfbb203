#pragma once

#include <map>
#include <optional>
#include <string>

namespace cairn::cloud {

struct ObjectResponse {
    std::optional<std::string> error;
    long code = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // lower-cased names

    [[nodiscard]] bool ok() const { return !error && code / 100 == 2; }
};

/**
 * Request/response seam between the object backend and an object store.
 * Failures are reported in the response, never thrown.
 */
class ObjectClient {
public:
    virtual ~ObjectClient() = default;

    virtual ObjectResponse getObject(const std::string& bucket, const std::string& key) = 0;

    virtual ObjectResponse putObject(const std::string& bucket, const std::string& key,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers) = 0;

    virtual ObjectResponse deleteObject(const std::string& bucket, const std::string& key) = 0;

    // HEAD: status code and headers only
    virtual ObjectResponse getObjectInfo(const std::string& bucket, const std::string& key) = 0;
};

} // namespace cairn::cloud
