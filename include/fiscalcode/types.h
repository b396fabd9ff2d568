/**
 * @file types.h
 * @brief Common types for the fiscal code library
 *
 * Identity input, gender enumeration and result structs shared by the
 * encoder, validator and decoder.
 */

#pragma once

#include <optional>
#include <string>

namespace fiscalcode {

/// @brief Gender as encoded in the day field (+40 for FEMALE)
enum class Gender {
    MALE,
    FEMALE
};

/// @brief Calendar date of birth (proleptic Gregorian)
struct BirthDate {
    int year = 0;
    int month = 0;   ///< 1-12
    int day = 0;     ///< 1-31

    bool operator==(const BirthDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const BirthDate& other) const { return !(*this == other); }
};

/// @brief Personal data a fiscal code is derived from
struct Identity {
    std::string firstName;
    std::string lastName;
    BirthDate birthDate;
    Gender gender = Gender::MALE;
    std::string placeCode;  ///< Cadastral code, 1 letter + 3 digits (e.g., "H501")
};

/// @brief Outcome of a formal validation
enum class ValidationStatus {
    VALID,              ///< Grammar and checksum ok (and identity matches, if given)
    EMPTY,              ///< Null or empty input
    TOO_SHORT,          ///< Fewer than 16 characters
    MALFORMED,          ///< Grammar fails in both plain and omocode-stripped form
    CHECKSUM_MISMATCH,  ///< Control character differs from the computed one
    IDENTITY_MISMATCH   ///< Formally valid but does not encode the given identity
};

/// @brief Formal validation result
struct ValidationResult {
    bool valid = false;
    ValidationStatus status = ValidationStatus::EMPTY;
    std::string normalizedCode;  ///< Trimmed, uppercased input
    bool omocode = false;        ///< True if any digit position holds a letter
    std::string message;         ///< Reason for rejection (empty when valid)
};

/// @brief Segments of a valid fiscal code
struct DecodedFiscalCode {
    std::string code;           ///< Normalized code as given (may be omocode)
    std::string surnameCode;
    std::string givenNameCode;
    BirthDate birthDate;
    Gender gender = Gender::MALE;
    std::string placeCode;      ///< Omocode-stripped place code
    char checksum = '\0';
    int omocodeLevel = 0;
};

/// @brief 'M' or 'F'
inline char genderToChar(Gender g) {
    return g == Gender::FEMALE ? 'F' : 'M';
}

/// @brief Parse 'M'/'F' (either case)
inline std::optional<Gender> parseGender(char c) {
    switch (c) {
        case 'M': case 'm': return Gender::MALE;
        case 'F': case 'f': return Gender::FEMALE;
        default:            return std::nullopt;
    }
}

/// @brief Convert ValidationStatus to string
inline std::string validationStatusToString(ValidationStatus s) {
    switch (s) {
        case ValidationStatus::VALID:             return "VALID";
        case ValidationStatus::EMPTY:             return "EMPTY";
        case ValidationStatus::TOO_SHORT:         return "TOO_SHORT";
        case ValidationStatus::MALFORMED:         return "MALFORMED";
        case ValidationStatus::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ValidationStatus::IDENTITY_MISMATCH: return "IDENTITY_MISMATCH";
    }
    return "UNKNOWN";
}

} // namespace fiscalcode
