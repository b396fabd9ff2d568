/**
 * @file omocode.cpp
 * @brief Omocode substitution implementation
 */

#include "fiscalcode/omocode.h"
#include "fiscalcode/checksum.h"
#include "fiscalcode/exceptions.h"
#include "fiscalcode/fiscal_code.h"
#include "fiscalcode/utils/text_normalizer.h"
#include <cctype>
#include <cstring>
#include <spdlog/spdlog.h>

namespace fiscalcode {

std::string stripOmocode(const std::string& code) {
    std::string result = code;
    for (size_t pos : DIGIT_POSITIONS) {
        if (pos >= result.size()) break;
        char c = result[pos];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '\0') continue;

        const char* found = std::strchr(OMOCODE_CHARS, c);
        if (found) {
            result[pos] = static_cast<char>('0' + (found - OMOCODE_CHARS));
        }
    }
    return result;
}

int omocodeLevel(const std::string& code) {
    int level = 0;
    for (size_t pos : DIGIT_POSITIONS) {
        if (pos >= code.size()) break;
        if (!std::isdigit(static_cast<unsigned char>(code[pos]))) {
            ++level;
        }
    }
    return level;
}

bool isOmocode(const std::string& code) {
    return omocodeLevel(code) > 0;
}

std::string applyOmocode(const std::string& code, int level) {
    if (level < 0 || level > MAX_OMOCODE_LEVEL) {
        throw InvalidInputException("level",
            "omocode level must be between 0 and " + std::to_string(MAX_OMOCODE_LEVEL));
    }
    if (!isValid(code)) {
        throw InvalidInputException("code", "not a valid fiscal code");
    }

    std::string body = stripOmocode(utils::normalize(code, false)).substr(0, BODY_LENGTH);

    // Substitute from the rightmost digit position leftwards
    for (int n = 0; n < level; ++n) {
        size_t pos = DIGIT_POSITIONS[DIGIT_POSITIONS.size() - 1 - n];
        body[pos] = OMOCODE_CHARS[body[pos] - '0'];
    }

    spdlog::debug("Applied omocode level {}", level);
    return body + checksum(body);
}

} // namespace fiscalcode
