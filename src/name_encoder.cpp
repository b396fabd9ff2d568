/**
 * @file name_encoder.cpp
 * @brief Name segment encoding implementation
 */

#include "fiscalcode/name_encoder.h"
#include "fiscalcode/utils/text_normalizer.h"
#include <cstring>

namespace fiscalcode {

namespace {

constexpr const char* VOWELS = "AEIOU";
constexpr const char* CONSONANTS = "BCDFGHJKLMNPQRSTVWXYZ";
constexpr size_t SEGMENT_LENGTH = 3;

bool isOneOf(char c, const char* set) {
    return c != '\0' && std::strchr(set, c) != nullptr;
}

std::string collect(const std::string& s, const char* set) {
    std::string out;
    for (char c : s) {
        if (isOneOf(c, set)) {
            out += c;
        }
    }
    return out;
}

/// Append vowels of s, then 'X', until code has three letters
std::string completeWithVowels(std::string code, const std::string& s) {
    for (char c : s) {
        if (code.length() >= SEGMENT_LENGTH) break;
        if (isOneOf(c, VOWELS)) {
            code += c;
        }
    }
    if (code.length() < SEGMENT_LENGTH) {
        code.append(SEGMENT_LENGTH - code.length(), 'X');
    }
    return code;
}

} // namespace

std::string surnameCode(const std::string& name) {
    std::string s = utils::normalize(name, true);
    std::string consonants = collect(s, CONSONANTS);
    if (consonants.length() > SEGMENT_LENGTH) {
        consonants.resize(SEGMENT_LENGTH);
    }
    return completeWithVowels(consonants, s);
}

std::string givenNameCode(const std::string& name) {
    std::string s = utils::normalize(name, true);
    std::string consonants = collect(s, CONSONANTS);

    std::string code;
    if (consonants.length() > SEGMENT_LENGTH) {
        // 1st, 3rd and 4th consonant
        code = {consonants[0], consonants[2], consonants[3]};
    } else {
        code = consonants;
    }
    return completeWithVowels(code, s);
}

} // namespace fiscalcode
