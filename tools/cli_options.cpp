/**
 * @file cli_options.cpp
 * @brief Argument and configuration handling for fiscalcode-cli
 */

#include "cli_options.h"
#include "fiscalcode/exceptions.h"
#include "fiscalcode/utils/date_utils.h"
#include <set>

namespace fiscalcode {
namespace cli {

namespace {

struct CommandSpec {
    std::string name;
    size_t positionalCount;
    std::set<std::string> options;
};

constexpr int MIN_REFERENCE_YEAR = 100;
constexpr int MAX_REFERENCE_YEAR = 9999;

const CommandSpec* findCommand(const std::string& command) {
    static const std::set<std::string> identityOptions = {
        "first-name", "last-name", "birth-date", "gender", "place"
    };
    static const std::vector<CommandSpec> commands = {
        {"encode", 0, identityOptions},
        {"validate", 1, identityOptions},
        {"decode", 1, {}},
        {"omocode", 1, {"level"}},
    };

    for (const auto& spec : commands) {
        if (spec.name == command) {
            return &spec;
        }
    }
    return nullptr;
}

} // namespace

bool isCommand(const std::string& command) {
    return findCommand(command) != nullptr;
}

Arguments parseArguments(const std::string& command, const std::vector<std::string>& args) {
    const CommandSpec* spec = findCommand(command);
    if (!spec) {
        throw InvalidInputException("command", "unknown command " + command);
    }

    Arguments result;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            result.positional.push_back(arg);
            continue;
        }

        std::string name = arg.substr(2);
        if (spec->options.count(name) == 0) {
            throw InvalidInputException(name, "unknown option --" + name);
        }
        if (i + 1 >= args.size()) {
            throw InvalidInputException(name, "missing value for --" + name);
        }
        result.options[name] = args[++i];
    }

    if (result.positional.size() != spec->positionalCount) {
        if (spec->positionalCount == 0) {
            throw InvalidInputException("code",
                "unexpected argument " + result.positional.front());
        }
        throw InvalidInputException("code", "expected exactly one fiscal code argument");
    }
    return result;
}

int referenceYear(const ConfigManager& config) {
    if (!config.has(ConfigManager::REFERENCE_YEAR)) {
        return utils::currentYear();
    }

    int year = config.requireInt(ConfigManager::REFERENCE_YEAR);
    if (year < MIN_REFERENCE_YEAR || year > MAX_REFERENCE_YEAR) {
        throw ConfigException(std::string(ConfigManager::REFERENCE_YEAR) + " must be between " +
                              std::to_string(MIN_REFERENCE_YEAR) + " and " +
                              std::to_string(MAX_REFERENCE_YEAR) + ": " + std::to_string(year));
    }
    return year;
}

} // namespace cli
} // namespace fiscalcode
