#pragma once

#include "cloud/ObjectClient.hpp"
#include "cloud/S3Credentials.hpp"
#include "util/curlWrappers.hpp"

#include <map>
#include <string>
#include <utility>
#include <curl/curl.h>

namespace cairn::cloud {

class S3Controller final : public ObjectClient {
public:
    explicit S3Controller(S3Credentials creds);

    ~S3Controller() override;

    ObjectResponse getObject(const std::string& bucket, const std::string& key) override;

    ObjectResponse putObject(const std::string& bucket, const std::string& key,
                             const std::string& body,
                             const std::map<std::string, std::string>& headers) override;

    ObjectResponse deleteObject(const std::string& bucket, const std::string& key) override;

    ObjectResponse getObjectInfo(const std::string& bucket, const std::string& key) override;

private:
    S3Credentials creds_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& bucket,
                                                       const std::string& key) const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             std::map<std::string, std::string> extra = {}) const;

    static ObjectResponse toObjectResponse(const char* op, const std::string& key, util::HttpResponse&& resp);
};

} // namespace cairn::cloud
