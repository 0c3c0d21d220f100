#pragma once

#include "common/operation_status.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class OptionKind {
    Value,       // --netmask <mask>, last occurrence wins
    Repeatable,  // --ip-range <range> [--ip-range <range> ...], order kept
    Flag,        // --force
    Toggle       // --shared / --not-shared
};

struct OptionSpec {
    std::string name;               // long form, e.g. "--port-group"
    std::string shortName;          // e.g. "-p", may be empty
    OptionKind kind = OptionKind::Value;
    bool required = false;
    std::string metavar;
    std::string help;
    std::string negatedName;        // Toggle only, e.g. "--not-shared"
    std::string negatedShortName;
    std::vector<std::string> aliases;
};

// Positional arguments are always required.
struct ArgumentSpec {
    std::string name;
    std::string metavar;
};

class ParsedArguments {
public:
    void setArgument(const std::string& name, const std::string& value);
    void addValue(const std::string& option, const std::string& value);
    void setValue(const std::string& option, const std::string& value);
    void setFlag(const std::string& option, bool value);
    void setHelpRequested(bool requested) { helpRequested_ = requested; }

    std::string argument(const std::string& name) const;
    bool hasValue(const std::string& option) const;
    std::string value(const std::string& option, const std::string& fallback = "") const;
    std::optional<std::string> optionalValue(const std::string& option) const;
    std::vector<std::string> values(const std::string& option) const;
    bool flag(const std::string& option, bool fallback = false) const;
    std::optional<bool> toggle(const std::string& option) const;
    bool helpRequested() const { return helpRequested_; }

private:
    std::map<std::string, std::string> arguments_;
    std::map<std::string, std::vector<std::string>> values_;
    std::map<std::string, bool> flags_;
    bool helpRequested_ = false;
};

// Parses `args` against a leaf's schema. Unknown options, missing option
// values, missing required arguments or options and surplus positionals are
// reported as ValidationError. Required checks are skipped when -h/--help is
// present.
OperationStatus parseCommandLine(const std::vector<ArgumentSpec>& arguments,
                                 const std::vector<OptionSpec>& options,
                                 const std::vector<std::string>& args,
                                 ParsedArguments& parsed);

// Strict base-10 conversion of an option value.
OperationStatus parseIntegerOption(const std::string& option, const std::string& text, int& value);
