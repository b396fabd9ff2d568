/**
 * @file json_mapper.cpp
 * @brief JSON mapping implementation
 */

#include "fiscalcode/json_mapper.h"
#include "fiscalcode/utils/date_utils.h"

namespace fiscalcode {

Json::Value toJson(const ValidationResult& result) {
    Json::Value json;
    json["valid"] = result.valid;
    json["status"] = validationStatusToString(result.status);
    json["code"] = result.normalizedCode;
    json["omocode"] = result.omocode;
    if (!result.message.empty()) {
        json["message"] = result.message;
    }
    return json;
}

Json::Value toJson(const DecodedFiscalCode& decoded) {
    Json::Value json;
    json["code"] = decoded.code;
    json["surnameCode"] = decoded.surnameCode;
    json["givenNameCode"] = decoded.givenNameCode;
    json["birthDate"] = utils::formatIsoDate(decoded.birthDate);
    json["gender"] = std::string(1, genderToChar(decoded.gender));
    json["placeCode"] = decoded.placeCode;
    json["checksum"] = std::string(1, decoded.checksum);
    json["omocodeLevel"] = decoded.omocodeLevel;
    return json;
}

std::string toJsonString(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

} // namespace fiscalcode
