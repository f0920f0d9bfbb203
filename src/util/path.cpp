#include "util/path.hpp"

#include <cctype>
#include <utility>
#include <vector>
#include <unicode/uchar.h>

namespace cairn::util {

namespace {

bool decodeNext(const std::string_view s, size_t& i, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        cp = b0;
        ++i;
        return true;
    }

    size_t len;
    if (b0 >= 0xC2 && b0 <= 0xDF) { len = 2; cp = b0 & 0x1F; }
    else if (b0 >= 0xE0 && b0 <= 0xEF) { len = 3; cp = b0 & 0x0F; }
    else if (b0 >= 0xF0 && b0 <= 0xF4) { len = 4; cp = b0 & 0x07; }
    else return false;

    if (i + len > s.size()) return false;

    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (b & 0x3F);
    }

    // overlong and out of range encodings
    if (len == 3 && cp < 0x800) return false;
    if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return false;

    i += len;
    return true;
}

bool containsForbidden(const std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        char32_t cp = 0;
        if (!decodeNext(s, i, cp)) return true;
        if (isForbiddenCodePoint(cp)) return true;
    }
    return false;
}

}

bool isForbiddenCodePoint(const char32_t cp) {
    if (cp > 0x10FFFF) return true;
    // Cc, Cf, Cs, Co and Cn (unassigned, noncharacters)
    return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & U_GC_C_MASK) != 0;
}

PathStatus normalizePath(const std::string_view raw, std::string& out) {
    std::string path(raw);
    for (auto& c : path) if (c == '\\') c = '/';

    if (containsForbidden(path)) return PathStatus::InvalidCharacter;

    std::vector<std::string_view> parts;
    const std::string_view view(path);
    size_t start = 0;
    while (start <= view.size()) {
        auto end = view.find('/', start);
        if (end == std::string_view::npos) end = view.size();
        const auto part = view.substr(start, end - start);
        start = end + 1;

        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (parts.empty()) return PathStatus::Traversal;
            parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }

    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) joined += '/';
        joined += parts[i];
    }

    out = std::move(joined);
    return PathStatus::Ok;
}

int naturalCaseCompare(const std::string_view a, const std::string_view b) {
    const auto isDigit = [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (isDigit(a[i]) && isDigit(b[j])) {
            while (i < a.size() && a[i] == '0') ++i;
            while (j < b.size() && b[j] == '0') ++j;

            const size_t si = i, sj = j;
            while (i < a.size() && isDigit(a[i])) ++i;
            while (j < b.size() && isDigit(b[j])) ++j;

            const auto na = a.substr(si, i - si), nb = b.substr(sj, j - sj);
            if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
            if (const int c = na.compare(nb); c != 0) return c < 0 ? -1 : 1;
            continue;
        }

        const auto ca = std::tolower(static_cast<unsigned char>(a[i]));
        const auto cb = std::tolower(static_cast<unsigned char>(b[j]));
        if (ca != cb) return ca < cb ? -1 : 1;
        ++i;
        ++j;
    }

    if (i < a.size()) return 1;
    if (j < b.size()) return -1;

    // equal ignoring case and zero padding, keep the order total
    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

std::string_view to_string(const PathStatus status) {
    switch (status) {
        case PathStatus::Ok: return "ok";
        case PathStatus::InvalidCharacter: return "invalid character";
        case PathStatus::Traversal: return "directory traversal";
    }
    return "unknown";
}

} // namespace cairn::util
