/**
 * @file omocode.h
 * @brief Omocode substitution
 *
 * When two people would receive the same code, the issuing office replaces
 * digits with letters, starting from the rightmost digit position. Digit
 * d is replaced by OMOCODE_CHARS[d].
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace fiscalcode {

/// Replacement letter for digits 0-9
inline constexpr char OMOCODE_CHARS[] = "LMNPQRSTUV";

/// Digit-bearing positions (year, day, place digits), left to right
inline constexpr std::array<size_t, 7> DIGIT_POSITIONS = {6, 7, 9, 10, 12, 13, 14};

/// Highest omocode level (every digit position substituted)
inline constexpr int MAX_OMOCODE_LEVEL = static_cast<int>(DIGIT_POSITIONS.size());

/**
 * @brief Replace omocode letters at digit positions with their digits
 *
 * Digits are kept. Letters outside OMOCODE_CHARS are kept so that grammar
 * validation still rejects them. Positions past the end are skipped.
 * Idempotent.
 *
 * @param code Normalized (uppercase) code
 * @return Code in non-omocode form
 */
std::string stripOmocode(const std::string& code);

/**
 * @brief Number of digit positions holding a non-digit
 */
int omocodeLevel(const std::string& code);

/**
 * @brief True if any digit position holds a non-digit
 */
bool isOmocode(const std::string& code);

/**
 * @brief Produce the omocode variant of the given level
 *
 * The code is first stripped, then the rightmost @p level digit positions
 * are substituted and the control character recomputed.
 *
 * @param code Valid fiscal code (plain or omocode)
 * @param level Number of positions to substitute, 0-7
 * @return Valid fiscal code with omocodeLevel() == level
 * @throws InvalidInputException if code is not valid or level out of range
 */
std::string applyOmocode(const std::string& code, int level);

} // namespace fiscalcode
