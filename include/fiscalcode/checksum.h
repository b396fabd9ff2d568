/**
 * @file checksum.h
 * @brief Control character (position 15)
 */

#pragma once

#include <string>

namespace fiscalcode {

/// Length of the code without its control character
inline constexpr size_t BODY_LENGTH = 15;

/// Full code length
inline constexpr size_t CODE_LENGTH = 16;

/**
 * @brief Compute the control character of a 15-character body
 *
 * Each character has a value (A-Z -> 0-25, 0-9 -> 0-9). Characters at even
 * 1-indexed positions add their value; characters at odd positions add the
 * odd-position table entry for their value. The total modulo 26 is mapped
 * back to A-Z.
 *
 * Omocode letters are ordinary letters here: the checksum of an omocode
 * code is computed over the code as issued.
 *
 * @param body First 15 characters, uppercase A-Z and 0-9 only
 * @return Control character 'A'-'Z'
 * @throws InvalidInputException if body has the wrong length or characters
 */
char checksum(const std::string& body);

} // namespace fiscalcode
