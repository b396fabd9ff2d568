/**
 * @file date_utils.cpp
 * @brief Calendar date utilities implementation
 */

#include "fiscalcode/utils/date_utils.h"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fiscalcode {
namespace utils {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

bool isValidDate(const BirthDate& date) {
    if (date.year < 1 || date.year > 9999) {
        return false;
    }
    if (date.month < 1 || date.month > 12) {
        return false;
    }
    return date.day >= 1 && date.day <= daysInMonth(date.year, date.month);
}

std::optional<BirthDate> parseIsoDate(const std::string& iso) {
    // Strict YYYY-MM-DD
    if (iso.length() != 10 || iso[4] != '-' || iso[7] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < iso.length(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(iso[i]))) {
            return std::nullopt;
        }
    }

    BirthDate date;
    date.year = std::stoi(iso.substr(0, 4));
    date.month = std::stoi(iso.substr(5, 2));
    date.day = std::stoi(iso.substr(8, 2));

    if (!isValidDate(date)) {
        return std::nullopt;
    }
    return date;
}

std::string formatIsoDate(const BirthDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day;
    return oss.str();
}

int resolveTwoDigitYear(int twoDigitYear, int referenceYear) {
    int century = (referenceYear / 100) * 100;
    int candidate = century + twoDigitYear;
    return candidate > referenceYear ? candidate - 100 : candidate;
}

int currentYear() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tmTime;
    if (!gmtime_r(&now, &tmTime)) {
        return 1970;
    }
    return tmTime.tm_year + 1900;
}

} // namespace utils
} // namespace fiscalcode
