/**
 * @file cli_options.h
 * @brief Argument and configuration handling for fiscalcode-cli
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "fiscalcode/config_manager.h"

namespace fiscalcode {
namespace cli {

struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;  ///< Option name without "--"
};

/**
 * @brief True for encode, validate, decode and omocode
 */
bool isCommand(const std::string& command);

/**
 * @brief Parse the arguments following a subcommand
 *
 * Each subcommand accepts a fixed set of "--name value" options and a fixed
 * number of positional arguments.
 *
 * @throws InvalidInputException for an unknown command, an option the
 *         command does not accept, an option without a value, or a wrong
 *         number of positional arguments
 */
Arguments parseArguments(const std::string& command, const std::vector<std::string>& args);

/**
 * @brief Reference year for decoding two-digit birth years
 *
 * FISCALCODE_REFERENCE_YEAR when set, otherwise the current year.
 *
 * @throws ConfigException if the key is set but is not a year in 100..9999
 */
int referenceYear(const ConfigManager& config);

} // namespace cli
} // namespace fiscalcode
