/**
 * @file fiscal_code.cpp
 * @brief Fiscal code encoding, validation and decoding implementation
 */

#include "fiscalcode/fiscal_code.h"
#include "fiscalcode/birth_encoder.h"
#include "fiscalcode/checksum.h"
#include "fiscalcode/exceptions.h"
#include "fiscalcode/name_encoder.h"
#include "fiscalcode/omocode.h"
#include "fiscalcode/utils/date_utils.h"
#include "fiscalcode/utils/text_normalizer.h"
#include <cstring>
#include <regex>
#include <spdlog/spdlog.h>

namespace fiscalcode {

namespace {

constexpr size_t PLACE_CODE_LENGTH = 4;
constexpr size_t PLACE_CODE_OFFSET = 11;

bool matchesGrammar(const std::string& code) {
    static const std::regex pattern("^[A-Z]{6}[0-9]{2}[A-Z][0-9]{2}[A-Z][0-9]{3}[A-Z]$");
    return std::regex_match(code, pattern);
}

void requireName(const std::string& value, const char* field, const char* label) {
    if (utils::trim(value).empty()) {
        throw InvalidInputException(field, std::string(label) + " is required");
    }
}

/// Place code with omocode letters in its digit positions replaced
std::string canonicalPlaceCode(const std::string& placeCode) {
    std::string result = utils::normalize(placeCode, false);
    for (size_t i = 1; i < result.size(); ++i) {
        const char* found = std::strchr(OMOCODE_CHARS, result[i]);
        if (result[i] != '\0' && found) {
            result[i] = static_cast<char>('0' + (found - OMOCODE_CHARS));
        }
    }
    return result;
}

int twoDigits(const std::string& s, size_t pos) {
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

ValidationResult reject(ValidationResult result, ValidationStatus status, const std::string& message) {
    result.valid = false;
    result.status = status;
    result.message = message;
    spdlog::debug("Fiscal code rejected: {} ({})", validationStatusToString(status), message);
    return result;
}

} // namespace

// --- Encoding ---

std::string encode(const Identity& identity) {
    requireName(identity.firstName, "firstName", "first name");
    requireName(identity.lastName, "lastName", "last name");

    if (identity.gender != Gender::MALE && identity.gender != Gender::FEMALE) {
        throw InvalidInputException("gender", "gender must be either 'M' or 'F'");
    }

    std::string place = utils::normalize(identity.placeCode, false);
    if (place.empty()) {
        throw InvalidInputException("placeCode", "place code is required");
    }
    if (place.length() != PLACE_CODE_LENGTH || !utils::isAsciiAlnum(place)) {
        throw InvalidInputException("placeCode",
            "place code must be " + std::to_string(PLACE_CODE_LENGTH) + " alphanumeric characters");
    }

    std::string body = surnameCode(identity.lastName)
                     + givenNameCode(identity.firstName)
                     + birthCode(identity.birthDate, identity.gender)
                     + place;

    std::string code = body + checksum(body);
    spdlog::debug("Encoded fiscal code (place={}, gender={})", place, genderToChar(identity.gender));
    return code;
}

std::string getFiscalCode(
    const std::string& firstName,
    const std::string& lastName,
    const BirthDate& birthDate,
    char gender,
    const std::string& placeCode)
{
    std::optional<Gender> parsed = parseGender(gender);
    if (!parsed) {
        // Missing names are reported before the gender, as in encode()
        requireName(firstName, "firstName", "first name");
        requireName(lastName, "lastName", "last name");
        throw InvalidInputException("gender", "gender must be either 'M' or 'F'");
    }

    Identity identity;
    identity.firstName = firstName;
    identity.lastName = lastName;
    identity.birthDate = birthDate;
    identity.gender = *parsed;
    identity.placeCode = placeCode;
    return encode(identity);
}

// --- Validation ---

ValidationResult validate(const std::string& code) noexcept {
    ValidationResult result;

    if (code.empty()) {
        return reject(result, ValidationStatus::EMPTY, "code is empty");
    }
    if (code.length() < CODE_LENGTH) {
        return reject(result, ValidationStatus::TOO_SHORT,
            "code has " + std::to_string(code.length()) + " characters, expected " +
            std::to_string(CODE_LENGTH));
    }

    result.normalizedCode = utils::normalize(code, false);
    const std::string& normalized = result.normalizedCode;

    // Grammar fails on omocode codes: retry on the stripped form
    if (!matchesGrammar(normalized) && !matchesGrammar(stripOmocode(normalized))) {
        return reject(result, ValidationStatus::MALFORMED, "code does not match the fiscal code format");
    }
    result.omocode = isOmocode(normalized);

    // Control character is computed over the code as issued, omocode letters included
    char expected = checksum(normalized.substr(0, BODY_LENGTH));
    if (normalized[BODY_LENGTH] != expected) {
        return reject(result, ValidationStatus::CHECKSUM_MISMATCH,
            std::string("control character is '") + normalized[BODY_LENGTH] +
            "', expected '" + expected + "'");
    }

    result.valid = true;
    result.status = ValidationStatus::VALID;
    return result;
}

ValidationResult validate(const std::string& code, const Identity& identity) noexcept {
    ValidationResult result = validate(code);
    if (!result.valid) {
        return result;
    }

    if (utils::trim(identity.firstName).empty()) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "first name is missing");
    }
    if (utils::trim(identity.lastName).empty()) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "last name is missing");
    }
    std::string place = canonicalPlaceCode(identity.placeCode);
    if (place.empty()) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "place code is missing");
    }

    std::string expectedBirth;
    try {
        expectedBirth = birthCode(identity.birthDate, identity.gender);
    } catch (const InvalidInputException& e) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, e.what());
    }

    const std::string plain = stripOmocode(result.normalizedCode);

    if (plain.compare(0, 3, surnameCode(identity.lastName)) != 0) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "surname does not match");
    }
    if (plain.compare(3, 3, givenNameCode(identity.firstName)) != 0) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "given name does not match");
    }
    if (plain.compare(6, 5, expectedBirth) != 0) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "birth date does not match");
    }
    if (plain.compare(PLACE_CODE_OFFSET, PLACE_CODE_LENGTH, place) != 0) {
        return reject(result, ValidationStatus::IDENTITY_MISMATCH, "place code does not match");
    }

    return result;
}

bool isValid(const std::string& code) noexcept {
    return validate(code).valid;
}

bool isValid(const std::string& code, const Identity& identity) noexcept {
    return validate(code, identity).valid;
}

bool isValid(
    const std::string& code,
    const std::string& firstName,
    const std::string& lastName,
    const BirthDate& birthDate,
    char gender,
    const std::string& placeCode) noexcept
{
    std::optional<Gender> parsed = parseGender(gender);
    if (!parsed) {
        spdlog::debug("Fiscal code rejected: gender '{}' is not M or F", gender);
        return false;
    }

    Identity identity;
    identity.firstName = firstName;
    identity.lastName = lastName;
    identity.birthDate = birthDate;
    identity.gender = *parsed;
    identity.placeCode = placeCode;
    return isValid(code, identity);
}

// --- Decoding ---

std::optional<DecodedFiscalCode> decode(const std::string& code, int referenceYear) noexcept {
    ValidationResult result = validate(code);
    if (!result.valid) {
        return std::nullopt;
    }

    const std::string plain = stripOmocode(result.normalizedCode);

    std::optional<int> month = monthFromLetter(plain[8]);
    if (!month) {
        spdlog::debug("Cannot decode fiscal code: unknown month letter '{}'", plain[8]);
        return std::nullopt;
    }

    int dayField = twoDigits(plain, 9);
    DecodedFiscalCode decoded;
    if (dayField > FEMALE_DAY_OFFSET) {
        decoded.gender = Gender::FEMALE;
        dayField -= FEMALE_DAY_OFFSET;
    } else {
        decoded.gender = Gender::MALE;
    }

    decoded.birthDate.year = utils::resolveTwoDigitYear(twoDigits(plain, 6), referenceYear);
    decoded.birthDate.month = *month;
    decoded.birthDate.day = dayField;
    if (!utils::isValidDate(decoded.birthDate)) {
        spdlog::debug("Cannot decode fiscal code: day field {} is not a day of {}",
                      twoDigits(plain, 9), utils::formatIsoDate(decoded.birthDate));
        return std::nullopt;
    }

    decoded.code = result.normalizedCode;
    decoded.surnameCode = plain.substr(0, 3);
    decoded.givenNameCode = plain.substr(3, 3);
    decoded.placeCode = plain.substr(PLACE_CODE_OFFSET, PLACE_CODE_LENGTH);
    decoded.checksum = result.normalizedCode[BODY_LENGTH];
    decoded.omocodeLevel = omocodeLevel(result.normalizedCode);
    return decoded;
}

} // namespace fiscalcode
