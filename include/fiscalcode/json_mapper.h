/**
 * @file json_mapper.h
 * @brief JSON representation of validation and decoding results
 */

#pragma once

#include <string>
#include <json/json.h>
#include "fiscalcode/types.h"

namespace fiscalcode {

/**
 * @brief Validation result as JSON
 *
 * Fields: valid, status, code, omocode, message (only when non-empty).
 */
Json::Value toJson(const ValidationResult& result);

/**
 * @brief Decoded code as JSON
 *
 * Fields: code, surnameCode, givenNameCode, birthDate (YYYY-MM-DD),
 * gender ("M"/"F"), placeCode, checksum, omocodeLevel.
 */
Json::Value toJson(const DecodedFiscalCode& decoded);

/**
 * @brief Serialize JSON
 * @param value JSON value
 * @param pretty Indent with two spaces; compact single line otherwise
 */
std::string toJsonString(const Json::Value& value, bool pretty = true);

} // namespace fiscalcode
