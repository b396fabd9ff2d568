/**
 * @file text_normalizer.h
 * @brief Text normalization for names and codes
 *
 * Trimming, ASCII uppercasing and removal of Italian accented vowels.
 * Accented vowels are recognized both as UTF-8 sequences and as single
 * ISO-8859-1 bytes.
 */

#pragma once

#include <string>

namespace fiscalcode {
namespace utils {

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Convert ASCII letters to uppercase
 *
 * Bytes outside the ASCII range are left untouched.
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Replace À È É Ì Ò Ù (and lowercase forms) with A E E I O U
 *
 * @param str UTF-8 or ISO-8859-1 input
 * @return String with those vowels unaccented and uppercase
 */
std::string stripDiacritics(const std::string& str);

/**
 * @brief Trim, uppercase and optionally strip diacritics
 *
 * Empty input is returned unchanged.
 *
 * @param text Input text
 * @param removeDiacritics Map accented vowels to plain uppercase vowels
 * @return Normalized text
 */
std::string normalize(const std::string& text, bool removeDiacritics);

/**
 * @brief Check that every character is an ASCII letter or digit
 *
 * @param str Input string
 * @return true if non-empty and alphanumeric
 */
bool isAsciiAlnum(const std::string& str);

} // namespace utils
} // namespace fiscalcode
