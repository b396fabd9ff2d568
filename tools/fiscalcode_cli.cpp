/**
 * @file fiscalcode_cli.cpp
 * @brief Command-line front end for the fiscal code library
 *
 * Usage:
 *   fiscalcode-cli encode --first-name N --last-name N --birth-date YYYY-MM-DD
 *                         --gender M|F --place CODE
 *   fiscalcode-cli validate CODE [--first-name N --last-name N
 *                         --birth-date YYYY-MM-DD --gender M|F --place CODE]
 *   fiscalcode-cli decode CODE
 *   fiscalcode-cli omocode CODE --level N
 *
 * Results are printed to stdout as JSON. Exit codes: 0 success/valid,
 * 1 invalid code, 2 usage or input error.
 *
 * Environment: FISCALCODE_LOG_LEVEL, FISCALCODE_LOG_FILE,
 * FISCALCODE_LOG_TO_FILE, FISCALCODE_REFERENCE_YEAR.
 */

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "cli_options.h"
#include "fiscalcode/config_manager.h"
#include "fiscalcode/exceptions.h"
#include "fiscalcode/fiscal_code.h"
#include "fiscalcode/json_mapper.h"
#include "fiscalcode/logger.h"
#include "fiscalcode/omocode.h"
#include "fiscalcode/utils/date_utils.h"

using namespace fiscalcode;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

constexpr const char* DEFAULT_LOG_FILE = "fiscalcode-cli.log";

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> [options]\n"
              << "  encode --first-name N --last-name N --birth-date YYYY-MM-DD --gender M|F --place CODE\n"
              << "  validate CODE [--first-name N --last-name N --birth-date YYYY-MM-DD --gender M|F --place CODE]\n"
              << "  decode CODE\n"
              << "  omocode CODE --level N\n";
}

using cli::Arguments;

std::string requireOption(const Arguments& args, const std::string& name) {
    auto it = args.options.find(name);
    if (it == args.options.end()) {
        throw InvalidInputException(name, "--" + name + " is required");
    }
    return it->second;
}

Identity identityFromOptions(const Arguments& args) {
    Identity identity;
    identity.firstName = requireOption(args, "first-name");
    identity.lastName = requireOption(args, "last-name");
    identity.placeCode = requireOption(args, "place");

    std::string dateText = requireOption(args, "birth-date");
    std::optional<BirthDate> date = utils::parseIsoDate(dateText);
    if (!date) {
        throw InvalidInputException("birth-date", "'" + dateText + "' is not a YYYY-MM-DD date");
    }
    identity.birthDate = *date;

    std::string genderText = requireOption(args, "gender");
    std::optional<Gender> gender = genderText.size() == 1 ? parseGender(genderText[0]) : std::nullopt;
    if (!gender) {
        throw InvalidInputException("gender", "gender must be either 'M' or 'F'");
    }
    identity.gender = *gender;
    return identity;
}

void print(const Json::Value& json) {
    std::cout << toJsonString(json) << std::endl;
}

int runEncode(const Arguments& args) {
    Json::Value out;
    out["code"] = encode(identityFromOptions(args));
    print(out);
    return EXIT_OK;
}

int runValidate(const Arguments& args) {
    const std::string& code = args.positional.front();
    ValidationResult result = args.options.empty()
        ? validate(code)
        : validate(code, identityFromOptions(args));
    print(toJson(result));
    return result.valid ? EXIT_OK : EXIT_INVALID;
}

int runDecode(const Arguments& args) {
    const std::string& code = args.positional.front();
    int referenceYear = cli::referenceYear(ConfigManager::getInstance());

    std::optional<DecodedFiscalCode> decoded = decode(code, referenceYear);
    if (!decoded) {
        ValidationResult result = validate(code);
        if (result.valid) {
            // Formally valid, but month/day do not form a date
            result.valid = false;
            result.status = ValidationStatus::MALFORMED;
            result.message = "birth date segment does not form a calendar date";
        }
        print(toJson(result));
        return EXIT_INVALID;
    }
    print(toJson(*decoded));
    return EXIT_OK;
}

int runOmocode(const Arguments& args) {
    const std::string& code = args.positional.front();
    std::string levelText = requireOption(args, "level");
    int level = 0;
    try {
        size_t pos = 0;
        level = std::stoi(levelText, &pos);
        if (pos != levelText.size()) {
            throw std::invalid_argument(levelText);
        }
    } catch (const std::exception&) {
        throw InvalidInputException("level", "'" + levelText + "' is not a number");
    }

    Json::Value out;
    out["code"] = applyOmocode(code, level);
    print(out);
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    ConfigManager& config = ConfigManager::getInstance();
    std::string logFile = config.getString(ConfigManager::LOG_FILE);
    Logger::initialize("fiscalcode-cli",
                       config.getString(ConfigManager::LOG_LEVEL, "warn"),
                       config.getBool(ConfigManager::LOG_TO_FILE, !logFile.empty()),
                       logFile.empty() ? std::string(DEFAULT_LOG_FILE) : logFile);

    if (argc < 2) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        printUsage(argv[0]);
        return EXIT_OK;
    }
    if (!cli::isCommand(command)) {
        spdlog::error("Unknown command: {}", command);
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        Arguments args = cli::parseArguments(command, std::vector<std::string>(argv + 2, argv + argc));
        spdlog::debug("Command: {}", command);

        if (command == "encode") return runEncode(args);
        if (command == "validate") return runValidate(args);
        if (command == "decode") return runDecode(args);
        return runOmocode(args);

    } catch (const InvalidInputException& e) {
        Json::Value out;
        out["error"] = e.what();
        out["field"] = e.field();
        print(out);
        return EXIT_USAGE;
    } catch (const ConfigException& e) {
        spdlog::error("{}", e.what());
        Json::Value out;
        out["error"] = e.what();
        print(out);
        return EXIT_USAGE;
    }
}
