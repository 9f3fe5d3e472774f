#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace LureNet {

class TextUtils {
public:
    /// Escape &, <, >, " and ' as HTML entities
    static std::string sanitizeHtml(const std::string& text);

    /// Replace each maximal invalid UTF-8 subpart with U+FFFD
    static std::string sanitizeUtf8(const std::string& bytes);

    static std::string toLower(std::string text);
    static std::string toUpper(std::string text);
    static std::string trim(const std::string& text);

    /// Case-insensitive prefix test
    static bool startsWithIgnoreCase(const std::string& text, const std::string& prefix);

    /// Case-insensitive substring test
    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    /// Split on \n, \r\n and lone \r; no trailing empty line for a final terminator
    static std::vector<std::string> splitLines(const std::string& text);

    /// Split on runs of whitespace
    static std::vector<std::string> splitWhitespace(const std::string& text);

    /// Keep at most maxChars code points; never splits a multi-byte sequence
    static std::string truncate(const std::string& text, std::size_t maxChars);
};

} // namespace LureNet
