/**
 * @file birth_encoder.cpp
 * @brief Birth segment encoding implementation
 */

#include "fiscalcode/birth_encoder.h"
#include "fiscalcode/exceptions.h"
#include "fiscalcode/utils/date_utils.h"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace fiscalcode {

std::string birthCode(const BirthDate& date, Gender gender) {
    if (!utils::isValidDate(date)) {
        throw InvalidInputException("birthDate",
            "birth date " + utils::formatIsoDate(date) + " is not a calendar date");
    }

    int dayField = 0;
    switch (gender) {
        case Gender::MALE:
            dayField = date.day;
            break;
        case Gender::FEMALE:
            dayField = date.day + FEMALE_DAY_OFFSET;
            break;
        default:
            throw InvalidInputException("gender", "gender must be either 'M' or 'F'");
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << (date.year % 100)
        << MONTH_LETTERS[date.month - 1]
        << std::setw(2) << dayField;
    return oss.str();
}

std::optional<int> monthFromLetter(char letter) {
    if (letter == '\0') {
        return std::nullopt;
    }
    const char* pos = std::strchr(MONTH_LETTERS, letter);
    if (!pos) {
        return std::nullopt;
    }
    return static_cast<int>(pos - MONTH_LETTERS) + 1;
}

} // namespace fiscalcode
