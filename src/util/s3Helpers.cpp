#include "util/s3Helpers.hpp"
#include "cloud/S3Credentials.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>

namespace cairn::util {

namespace {

std::string toHex(const unsigned char* data, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string md5Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("MD5 digest failed");
    return toHex(digest, len);
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);
    return toHex(sig, SHA256_DIGEST_LENGTH);
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::string out;
    size_t start = 0;
    while (true) {
        const auto end = key.find('/', start);
        const auto seg = key.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (!seg.empty()) {
            char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
            if (!esc) throw std::runtime_error("escape failed");
            out += esc;
            curl_free(esc);
        }

        if (end == std::string::npos) break;
        out += '/';
        start = end + 1;
    }
    return out;
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string buildAuthorizationHeader(const cloud::S3Credentials& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // std::map keeps the names sorted, as the canonical form requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << canonicalQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    const std::string credentialScope = dateStamp + "/" + creds.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

std::map<std::string, std::string> parseResponseHeaders(const std::string& raw) {
    std::map<std::string, std::string> headers;
    std::istringstream headerStream(raw);
    std::string line;
    while (std::getline(headerStream, line)) {
        // a status line opens a new block (redirects, 100-continue)
        if (line.rfind("HTTP/", 0) == 0) {
            headers.clear();
            continue;
        }

        if (const auto pos = line.find(':'); pos != std::string::npos) {
            std::string name = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trimInPlace(name);
            trimInPlace(value);
            headers[toLower(std::move(name))] = std::move(value);
        }
    }
    return headers;
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s, [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace cairn::util
