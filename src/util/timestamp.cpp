#include "util/timestamp.hpp"

#include <array>
#include <iomanip>
#include <locale>
#include <sstream>

namespace cairn::util {

std::time_t parseHttpDate(const std::string& value) {
    // asctime pads single digit days with a space ("Nov  6"), collapse it
    std::string collapsed;
    collapsed.reserve(value.size());
    for (const char c : value) {
        if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') continue;
        collapsed += c;
    }
    while (!collapsed.empty() && collapsed.back() == ' ') collapsed.pop_back();
    if (collapsed.empty()) return 0;

    static constexpr std::array<const char*, 3> formats {
        "%a, %d %b %Y %H:%M:%S GMT",   // RFC 1123
        "%A, %d-%b-%y %H:%M:%S GMT",   // RFC 850
        "%a %b %d %H:%M:%S %Y",        // asctime
    };

    for (const auto* fmt : formats) {
        std::tm tm{};
        std::istringstream ss(collapsed);
        ss.imbue(std::locale::classic());
        ss >> std::get_time(&tm, fmt);
        if (ss.fail()) continue;
        ss >> std::ws;
        if (!ss.eof()) continue;
        return timegm(&tm);
    }

    return 0;
}

std::string toHttpDate(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

} // namespace cairn::util
