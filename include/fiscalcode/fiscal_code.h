/**
 * @file fiscal_code.h
 * @brief Fiscal code encoding, validation and decoding
 *
 * A fiscal code is 16 characters:
 *
 *   [LLL][LLL][YY][M][DD][P][PPP][C]
 *    |    |    |   |  |   |  |    +-- control character
 *    |    |    |   |  |   +--+------- place of birth code
 *    |    |    |   |  +-------------- day (+40 for women)
 *    |    |    |   +----------------- month letter
 *    |    |    +--------------------- year of birth
 *    |    +-------------------------- given name
 *    +------------------------------- surname
 *
 * Validation is formal only: a valid code is not necessarily assigned to
 * anybody.
 */

#pragma once

#include <optional>
#include <string>
#include "fiscalcode/types.h"

namespace fiscalcode {

/**
 * @brief Compute the fiscal code of an identity
 *
 * @param identity Names, birth date, gender and place code
 * @return 16-character code
 * @throws InvalidInputException when a name or the place code is empty,
 *         the place code is not 4 alphanumeric characters, the gender is
 *         outside the enumeration or the birth date does not exist
 */
std::string encode(const Identity& identity);

/**
 * @brief Compute the fiscal code from individual fields
 *
 * @param gender 'M' or 'F' (either case)
 * @throws InvalidInputException as encode(), and for any other gender
 */
std::string getFiscalCode(
    const std::string& firstName,
    const std::string& lastName,
    const BirthDate& birthDate,
    char gender,
    const std::string& placeCode
);

/**
 * @brief Check grammar (plain or omocode) and control character
 *
 * @param code Candidate code, surrounding whitespace and case ignored
 * @return Result with the first failing stage
 */
ValidationResult validate(const std::string& code) noexcept;

/**
 * @brief Formal validation plus comparison against an identity
 *
 * Segments are compared in non-omocode form; the control character is
 * checked on the code as given.
 */
ValidationResult validate(const std::string& code, const Identity& identity) noexcept;

/**
 * @brief validate(code).valid
 */
bool isValid(const std::string& code) noexcept;

/**
 * @brief validate(code, identity).valid
 */
bool isValid(const std::string& code, const Identity& identity) noexcept;

/**
 * @brief Identity check from individual fields
 *
 * @return false for any invalid input, including a gender other than M/F
 */
bool isValid(
    const std::string& code,
    const std::string& firstName,
    const std::string& lastName,
    const BirthDate& birthDate,
    char gender,
    const std::string& placeCode
) noexcept;

/**
 * @brief Split a valid code into its segments
 *
 * Only the last two digits of the birth year are encoded; the century is
 * the latest one that does not put the year after @p referenceYear.
 *
 * @param code Candidate code
 * @param referenceYear Latest admissible birth year (usually the current year)
 * @return Decoded fields, or std::nullopt if the code is not valid or its
 *         month/day fields do not form a calendar date
 */
std::optional<DecodedFiscalCode> decode(const std::string& code, int referenceYear) noexcept;

} // namespace fiscalcode
