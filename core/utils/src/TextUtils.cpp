#include "TextUtils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace LureNet {

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD";

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/// Sequence length announced by a lead byte, 0 when it cannot start one
std::size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

/// Allowed range of the second byte; excludes overlongs, surrogates and values past U+10FFFF
void secondByteRange(unsigned char lead, unsigned char& lo, unsigned char& hi) {
    lo = 0x80;
    hi = 0xBF;
    if (lead == 0xE0) lo = 0xA0;
    else if (lead == 0xED) hi = 0x9F;
    else if (lead == 0xF0) lo = 0x90;
    else if (lead == 0xF4) hi = 0x8F;
}

} // namespace

std::string TextUtils::sanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<unsigned char>(bytes[i]);
        std::size_t length = sequenceLength(lead);
        if (length == 1) {
            out += bytes[i++];
            continue;
        }
        if (length == 0) {
            out += kReplacementChar;
            ++i;
            continue;
        }

        unsigned char lo, hi;
        secondByteRange(lead, lo, hi);
        std::size_t valid = 1;
        while (valid < length && i + valid < bytes.size()) {
            auto c = static_cast<unsigned char>(bytes[i + valid]);
            bool ok = valid == 1 ? (c >= lo && c <= hi) : isContinuation(c);
            if (!ok) break;
            ++valid;
        }

        if (valid == length) {
            out.append(bytes, i, length);
        } else {
            out += kReplacementChar;
        }
        i += valid;
    }
    return out;
}

std::string TextUtils::sanitizeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string TextUtils::toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string TextUtils::toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string TextUtils::trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n\v\f");
    return text.substr(start, end - start + 1);
}

bool TextUtils::startsWithIgnoreCase(const std::string& text, const std::string& prefix) {
    if (prefix.size() > text.size()) return false;
    return toLower(text.substr(0, prefix.size())) == toLower(prefix);
}

bool TextUtils::containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::vector<std::string> TextUtils::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::vector<std::string> TextUtils::splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string TextUtils::truncate(const std::string& text, std::size_t maxChars) {
    if (text.size() <= maxChars) return text;

    std::size_t end = 0;
    for (std::size_t count = 0; count < maxChars && end < text.size(); ++count) {
        ++end;
        while (end < text.size() && isContinuation(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
    }
    return text.substr(0, end);
}

} // namespace LureNet
