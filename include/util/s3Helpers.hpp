#pragma once

#include <map>
#include <string>
#include <curl/curl.h>

namespace cairn::cloud {
struct S3Credentials;
} // namespace cairn::cloud

namespace cairn::util {

std::string sha256Hex(const std::string& data);
std::string md5Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// Percent-encodes each segment of an object key, keeping the '/' separators.
std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

/**
 * Computes the AWS SigV4 Authorization header value.
 * `headers` must hold lower-cased names and include x-amz-date; every entry is signed.
 */
std::string buildAuthorizationHeader(const cloud::S3Credentials& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery = "");

// Raw response header block to name -> value with lower-cased names. Only the last block is kept.
std::map<std::string, std::string> parseResponseHeaders(const std::string& raw);

void trimInPlace(std::string& s);
std::string toLower(std::string s);

void ensureCurlGlobalInit();

} // namespace cairn::util
