/**
 * @file exceptions.h
 * @brief Exception hierarchy for the fiscal code library
 *
 * Only the encode path throws. Validation and decoding report formal
 * invalidity through return values.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fiscalcode {

/**
 * @brief Base exception for all fiscal code errors
 */
class FiscalCodeException : public std::runtime_error {
public:
    explicit FiscalCodeException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Required input missing or outside its domain
 */
class InvalidInputException : public FiscalCodeException {
private:
    std::string field_;

public:
    /**
     * @param field Name of the offending input (e.g., "firstName")
     * @param message Human-readable description
     */
    InvalidInputException(std::string field, const std::string& message)
        : FiscalCodeException("Invalid input: " + message),
          field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const noexcept {
        return field_;
    }
};

/**
 * @brief Configuration error
 */
class ConfigException : public FiscalCodeException {
public:
    explicit ConfigException(const std::string& message)
        : FiscalCodeException("Configuration error: " + message) {}
};

} // namespace fiscalcode
