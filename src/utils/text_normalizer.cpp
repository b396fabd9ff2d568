/**
 * @file text_normalizer.cpp
 * @brief Text normalization implementation
 */

#include "fiscalcode/utils/text_normalizer.h"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace fiscalcode {
namespace utils {

namespace {

struct AccentMapping {
    unsigned char latin1;     ///< ISO-8859-1 code point
    unsigned char utf8Trail;  ///< Second byte of the UTF-8 form (lead byte 0xC3)
    char plain;
};

// À È É Ì Ò Ù à è é ì ò ù
constexpr AccentMapping ACCENTS[] = {
    {0xC0, 0x80, 'A'}, {0xC8, 0x88, 'E'}, {0xC9, 0x89, 'E'},
    {0xCC, 0x8C, 'I'}, {0xD2, 0x92, 'O'}, {0xD9, 0x99, 'U'},
    {0xE0, 0xA0, 'A'}, {0xE8, 0xA8, 'E'}, {0xE9, 0xA9, 'E'},
    {0xEC, 0xAC, 'I'}, {0xF2, 0xB2, 'O'}, {0xF9, 0xB9, 'U'},
};

constexpr unsigned char UTF8_LEAD_LATIN1_SUPPLEMENT = 0xC3;

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) {
                       return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A')
                                                     : static_cast<char>(c);
                   });
    return result;
}

std::string stripDiacritics(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        auto c = static_cast<unsigned char>(str[i]);
        if (c < 0x80) {
            result += str[i];
            continue;
        }

        bool hasTrail = i + 1 < str.size() &&
                        isContinuationByte(static_cast<unsigned char>(str[i + 1]));

        if (c == UTF8_LEAD_LATIN1_SUPPLEMENT && hasTrail) {
            auto trail = static_cast<unsigned char>(str[i + 1]);
            auto it = std::find_if(std::begin(ACCENTS), std::end(ACCENTS),
                                   [trail](const AccentMapping& m) { return m.utf8Trail == trail; });
            if (it != std::end(ACCENTS)) {
                result += it->plain;
            } else {
                result += str[i];
                result += str[i + 1];
            }
            ++i;
            continue;
        }

        // Lone ISO-8859-1 byte; a byte followed by a continuation byte
        // belongs to some other UTF-8 sequence and is copied through
        if (!hasTrail) {
            auto it = std::find_if(std::begin(ACCENTS), std::end(ACCENTS),
                                   [c](const AccentMapping& m) { return m.latin1 == c; });
            if (it != std::end(ACCENTS)) {
                result += it->plain;
                continue;
            }
        }
        result += str[i];
    }

    return result;
}

std::string normalize(const std::string& text, bool removeDiacritics) {
    if (text.empty()) {
        return text;
    }

    std::string result = toUpper(trim(text));
    if (removeDiacritics) {
        result = stripDiacritics(result);
    }
    return result;
}

bool isAsciiAlnum(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    });
}

} // namespace utils
} // namespace fiscalcode
