#include "cli/argument_parser.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>

void ParsedArguments::setArgument(const std::string& name, const std::string& value) {
    arguments_[name] = value;
}

void ParsedArguments::addValue(const std::string& option, const std::string& value) {
    values_[option].push_back(value);
}

void ParsedArguments::setValue(const std::string& option, const std::string& value) {
    values_[option] = {value};
}

void ParsedArguments::setFlag(const std::string& option, bool value) {
    flags_[option] = value;
}

std::string ParsedArguments::argument(const std::string& name) const {
    auto it = arguments_.find(name);
    return it != arguments_.end() ? it->second : std::string();
}

bool ParsedArguments::hasValue(const std::string& option) const {
    auto it = values_.find(option);
    return it != values_.end() && !it->second.empty();
}

std::string ParsedArguments::value(const std::string& option, const std::string& fallback) const {
    auto it = values_.find(option);
    if (it == values_.end() || it->second.empty()) {
        return fallback;
    }
    return it->second.back();
}

std::optional<std::string> ParsedArguments::optionalValue(const std::string& option) const {
    if (!hasValue(option)) {
        return std::nullopt;
    }
    return value(option);
}

std::vector<std::string> ParsedArguments::values(const std::string& option) const {
    auto it = values_.find(option);
    return it != values_.end() ? it->second : std::vector<std::string>();
}

bool ParsedArguments::flag(const std::string& option, bool fallback) const {
    auto it = flags_.find(option);
    return it != flags_.end() ? it->second : fallback;
}

std::optional<bool> ParsedArguments::toggle(const std::string& option) const {
    auto it = flags_.find(option);
    if (it == flags_.end()) {
        return std::nullopt;
    }
    return it->second;
}

static const OptionSpec* findOption(const std::vector<OptionSpec>& options, const std::string& token,
                                    bool& negated) {
    for (const auto& option : options) {
        negated = false;
        if (token == option.name || (!option.shortName.empty() && token == option.shortName)) {
            return &option;
        }
        for (const auto& alias : option.aliases) {
            if (token == alias) {
                return &option;
            }
        }
        if (option.kind == OptionKind::Toggle
            && ((!option.negatedName.empty() && token == option.negatedName)
                || (!option.negatedShortName.empty() && token == option.negatedShortName))) {
            negated = true;
            return &option;
        }
    }
    negated = false;
    return nullptr;
}

OperationStatus parseCommandLine(const std::vector<ArgumentSpec>& arguments,
                                 const std::vector<OptionSpec>& options,
                                 const std::vector<std::string>& args,
                                 ParsedArguments& parsed) {
    std::vector<std::string> positionals;
    bool optionsEnded = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (optionsEnded || arg.size() < 2 || arg[0] != '-') {
            positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            parsed.setHelpRequested(true);
            continue;
        }

        std::string token = arg;
        std::optional<std::string> inlineValue;
        size_t equals = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && equals != std::string::npos) {
            token = arg.substr(0, equals);
            inlineValue = arg.substr(equals + 1);
        }

        bool negated = false;
        const OptionSpec* option = findOption(options, token, negated);
        if (!option) {
            return OperationStatus::failure(ErrorKind::ValidationError, "No such option: " + token);
        }

        switch (option->kind) {
            case OptionKind::Flag:
            case OptionKind::Toggle:
                if (inlineValue) {
                    return OperationStatus::failure(ErrorKind::ValidationError,
                                                    "Option " + token + " does not take a value");
                }
                parsed.setFlag(option->name, !negated);
                break;
            case OptionKind::Value:
            case OptionKind::Repeatable: {
                std::string value;
                if (inlineValue) {
                    value = *inlineValue;
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    return OperationStatus::failure(ErrorKind::ValidationError,
                                                    "Option " + token + " requires an argument");
                }
                if (option->kind == OptionKind::Value) {
                    parsed.setValue(option->name, value);
                } else {
                    parsed.addValue(option->name, value);
                }
                break;
            }
        }
    }

    if (parsed.helpRequested()) {
        return OperationStatus::success();
    }

    if (positionals.size() > arguments.size()) {
        return OperationStatus::failure(ErrorKind::ValidationError,
                                        "Got unexpected extra argument: " + positionals[arguments.size()]);
    }
    for (size_t i = 0; i < arguments.size(); i++) {
        if (i >= positionals.size()) {
            return OperationStatus::failure(ErrorKind::ValidationError,
                                            "Missing argument " + arguments[i].metavar);
        }
        parsed.setArgument(arguments[i].name, positionals[i]);
    }

    for (const auto& option : options) {
        if (option.required && !parsed.hasValue(option.name)) {
            return OperationStatus::failure(ErrorKind::ValidationError,
                                            "Missing option " + option.name);
        }
    }

    Logger::debug("Parsed " + std::to_string(positionals.size()) + " argument(s)");
    return OperationStatus::success();
}

OperationStatus parseIntegerOption(const std::string& option, const std::string& text, int& value) {
    if (text.empty()) {
        return OperationStatus::failure(ErrorKind::ValidationError, "Option " + option + " expects an integer");
    }

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return OperationStatus::failure(ErrorKind::ValidationError,
                                        "Option " + option + " expects an integer, got '" + text + "'");
    }
    value = static_cast<int>(parsed);
    return OperationStatus::success();
}
