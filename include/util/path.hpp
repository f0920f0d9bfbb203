#pragma once

#include <string>
#include <string_view>

namespace cairn::util {

enum class PathStatus { Ok, InvalidCharacter, Traversal };

/**
 * Turns a caller supplied path into a canonical relative path.
 *
 * Backslashes are accepted as separators. Empty and "." segments are dropped,
 * ".." pops the previous segment. Popping past the start of the path yields
 * PathStatus::Traversal. Any code point of general category C (control, format,
 * surrogate, private use, unassigned) or malformed UTF-8 yields
 * PathStatus::InvalidCharacter.
 *
 * @p out is only assigned when the result is PathStatus::Ok.
 */
[[nodiscard]] PathStatus normalizePath(std::string_view raw, std::string& out);

[[nodiscard]] bool isForbiddenCodePoint(char32_t cp);

// Case-insensitive ordering where runs of digits compare by numeric value.
[[nodiscard]] int naturalCaseCompare(std::string_view a, std::string_view b);

inline bool naturalCaseLess(const std::string& a, const std::string& b) {
    return naturalCaseCompare(a, b) < 0;
}

std::string_view to_string(PathStatus status);

} // namespace cairn::util
