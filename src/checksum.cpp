/**
 * @file checksum.cpp
 * @brief Control character computation
 */

#include "fiscalcode/checksum.h"
#include "fiscalcode/exceptions.h"

namespace fiscalcode {

namespace {

// Contribution of a character at an odd (1-indexed) position, by value
constexpr int ODD_VALUES[26] = {
    1, 0, 5, 7, 9, 13, 15, 17, 19, 21, 2, 4, 18,
    20, 11, 3, 6, 8, 12, 14, 16, 10, 22, 25, 24, 23
};

constexpr int ALPHABET_SIZE = 26;

int charValue(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '0' && c <= '9') return c - '0';
    return -1;
}

} // namespace

char checksum(const std::string& body) {
    if (body.length() != BODY_LENGTH) {
        throw InvalidInputException("body",
            "checksum body must be " + std::to_string(BODY_LENGTH) +
            " characters, got " + std::to_string(body.length()));
    }

    int total = 0;
    for (size_t i = 0; i < body.length(); ++i) {
        int value = charValue(body[i]);
        if (value < 0) {
            throw InvalidInputException("body",
                "invalid character at position " + std::to_string(i) + " of checksum body");
        }
        // i is 0-indexed: even i is an odd 1-indexed position
        total += (i % 2 == 0) ? ODD_VALUES[value] : value;
    }

    return static_cast<char>('A' + total % ALPHABET_SIZE);
}

} // namespace fiscalcode
