/**
 * @file date_utils.h
 * @brief Calendar date utilities
 *
 * Validation, ISO 8601 date parsing/formatting and two-digit year
 * resolution for birth dates.
 */

#pragma once

#include <optional>
#include <string>
#include "fiscalcode/types.h"

namespace fiscalcode {
namespace utils {

/**
 * @brief Check if year is leap year
 *
 * @param year Year number
 * @return true if leap year
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 *
 * @param year Year number
 * @param month Month number (1-12)
 * @return Number of days in month, 0 for an invalid month
 */
int daysInMonth(int year, int month);

/**
 * @brief Check that a date exists in the calendar (years 1-9999)
 */
bool isValidDate(const BirthDate& date);

/**
 * @brief Parse "YYYY-MM-DD"
 *
 * @param iso ISO 8601 calendar date
 * @return Parsed date, or std::nullopt if malformed or not a real date
 */
std::optional<BirthDate> parseIsoDate(const std::string& iso);

/**
 * @brief Format as "YYYY-MM-DD"
 */
std::string formatIsoDate(const BirthDate& date);

/**
 * @brief Resolve a two-digit year to the latest century not after referenceYear
 *
 * Example with referenceYear 2026: 26 -> 2026, 27 -> 1927, 50 -> 1950.
 *
 * @param twoDigitYear Year of century (0-99)
 * @param referenceYear Latest admissible year
 * @return Four-digit year
 */
int resolveTwoDigitYear(int twoDigitYear, int referenceYear);

/**
 * @brief Current calendar year (UTC)
 */
int currentYear();

} // namespace utils
} // namespace fiscalcode
