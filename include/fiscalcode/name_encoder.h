/**
 * @file name_encoder.h
 * @brief Surname and given-name segments (positions 0-5)
 *
 * Pure functions. Names are normalized with diacritic removal; characters
 * other than A-Z are ignored.
 */

#pragma once

#include <string>

namespace fiscalcode {

/**
 * @brief Three-letter surname segment
 *
 * First three consonants, then vowels in order of appearance, then 'X'
 * padding. "De Angelis" -> "DNG", "Fo" -> "FOX".
 *
 * @param name Last name as entered
 * @return 3 uppercase letters ("XXX" if the name has no letters)
 */
std::string surnameCode(const std::string& name);

/**
 * @brief Three-letter given-name segment
 *
 * Like surnameCode, except that a name with four or more consonants uses
 * the 1st, 3rd and 4th consonant. "Matteo" -> "MTT", "Gianfranco" -> "GFR".
 *
 * @param name First name as entered
 * @return 3 uppercase letters ("XXX" if the name has no letters)
 */
std::string givenNameCode(const std::string& name);

} // namespace fiscalcode
