/**
 * @file birth_encoder.h
 * @brief Birth date and gender segment (positions 6-10)
 */

#pragma once

#include <optional>
#include <string>
#include "fiscalcode/types.h"

namespace fiscalcode {

/// Month letters, January = 'A' ... December = 'T'
inline constexpr char MONTH_LETTERS[] = "ABCDEHLMPRST";

/// Added to the day of month for FEMALE
inline constexpr int FEMALE_DAY_OFFSET = 40;

/**
 * @brief Five-character birth segment: YY, month letter, DD
 *
 * DD is the zero-padded day for MALE and day + 40 for FEMALE.
 * 1950-05-04 MALE -> "50E04", FEMALE -> "50E44".
 *
 * @param date Birth date
 * @param gender Gender
 * @return 5-character segment
 * @throws InvalidInputException if the date is not a calendar date or the
 *         gender is outside the enumeration
 */
std::string birthCode(const BirthDate& date, Gender gender);

/**
 * @brief Month number (1-12) for a month letter
 *
 * @param letter Uppercase month letter
 * @return Month, or std::nullopt for a letter outside MONTH_LETTERS
 */
std::optional<int> monthFromLetter(char letter);

} // namespace fiscalcode
