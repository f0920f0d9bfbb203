#include "cloud/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

using namespace cairn::cloud;
using namespace cairn::util;
using namespace cairn::logging;

S3Controller::S3Controller(S3Credentials creds) : creds_(std::move(creds)) {
    if (creds_.endpoint.empty()) throw std::invalid_argument("S3Controller requires an endpoint");
    while (creds_.endpoint.size() > 1 && creds_.endpoint.back() == '/') creds_.endpoint.pop_back();
    if (creds_.region.empty()) creds_.region = "auto";
    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

ObjectResponse S3Controller::getObject(const std::string& bucket, const std::string& key) {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const std::string payloadHash = "UNSIGNED-PAYLOAD";
    const SList hdrs = makeSigHeaders("GET", canonical, payloadHash);

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    return toObjectResponse("getObject", key, std::move(resp));
}

ObjectResponse S3Controller::putObject(const std::string& bucket, const std::string& key,
                                       const std::string& body,
                                       const std::map<std::string, std::string>& headers) {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    std::map<std::string, std::string> extra;
    for (const auto& [name, value] : headers) {
        std::string n = toLower(name), v = value;
        trimInPlace(n);
        trimInPlace(v);
        if (n.empty()) continue;
        extra[n] = v;
    }

    const std::string payloadHash = sha256Hex(body);
    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash, std::move(extra));
    if (!headers.contains("Content-Type") && !headers.contains("content-type"))
        hdrs.add("Content-Type: application/octet-stream");
    hdrs.add("Expect:");

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    return toObjectResponse("putObject", key, std::move(resp));
}

ObjectResponse S3Controller::deleteObject(const std::string& bucket, const std::string& key) {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    return toObjectResponse("deleteObject", key, std::move(resp));
}

ObjectResponse S3Controller::getObjectInfo(const std::string& bucket, const std::string& key) {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const std::string payloadHash = "UNSIGNED-PAYLOAD";
    const SList hdrs = makeSigHeaders("HEAD", canonical, payloadHash);

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);            // HEAD request
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    return toObjectResponse("getObjectInfo", key, std::move(resp));
}

ObjectResponse S3Controller::toObjectResponse(const char* op, const std::string& key, HttpResponse&& resp) {
    ObjectResponse out;
    out.code = resp.http;
    out.headers = parseResponseHeaders(resp.hdr);
    out.body = std::move(resp.body);

    if (resp.curl != CURLE_OK) {
        out.error = curl_easy_strerror(resp.curl);
        LogRegistry::cloud()->error("[S3Controller] {} failed for {}: CURL={} ({})",
                                    op, key, static_cast<int>(resp.curl), *out.error);
        return out;
    }

    if (resp.http / 100 != 2) {
        out.error = fmt::format("HTTP {}", resp.http);
        // a missing key is routine for existence checks
        if (resp.http == 404) LogRegistry::cloud()->debug("[S3Controller] {} {}: not found", op, key);
        else LogRegistry::cloud()->error("[S3Controller] {} failed for {}: HTTP={} Response:\n{}",
                                         op, key, resp.http, out.body);
    }

    return out;
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
            {"host", creds_.host()},
            {"x-amz-content-sha256", payloadHash},
            {"x-amz-date", getCurrentTimestamp()}
    };
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& bucket,
                                                                 const std::string& key) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    const auto canonicalPath = "/" + bucket + "/" + escapedKey;
    const auto url = creds_.endpoint + canonicalPath;
    return {canonicalPath, url};
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash,
                                   std::map<std::string, std::string> extra) const {
    auto base = buildHeaderMap(payloadHash);      // host + dates
    base.merge(extra);
    const auto auth = buildAuthorizationHeader(creds_, method, canonical, base, payloadHash);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) {
        if (k == "host") continue;   // curl sends it from the URL
        out.add(k + ": " + v);
    }
    return out;
}
