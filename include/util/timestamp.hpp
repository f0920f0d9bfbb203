#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace cairn::util {

/**
 * Parses an HTTP date (RFC 1123, RFC 850 or asctime form) into unix seconds.
 * Returns 0 when the value matches none of them.
 */
[[nodiscard]] std::time_t parseHttpDate(const std::string& value);

[[nodiscard]] std::string toHttpDate(std::time_t ts);

inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

} // namespace cairn::util
