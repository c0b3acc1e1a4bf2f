#include "cli/ArgParser.h"
#include "core/error/Exceptions.h"
#include <stdexcept>

namespace planrunner::cli {

std::optional<std::string> ParsedArgs::value(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<std::string> ParsedArgs::values(const std::string& name) const {
    auto it = options.find(name);
    return it == options.end() ? std::vector<std::string>{} : it->second;
}

std::optional<int> ParsedArgs::intValue(const std::string& name) const {
    auto text = value(name);
    if (!text) {
        return std::nullopt;
    }
    return ArgParser::parseInt(*text, "--" + name);
}

std::optional<std::string> ParsedArgs::positional(size_t index) const {
    if (index >= positionals.size()) {
        return std::nullopt;
    }
    return positionals[index];
}

ArgParser::ArgParser(std::set<std::string> booleanFlags) : booleanFlags_(std::move(booleanFlags)) {}

int ArgParser::parseInt(const std::string& text, const std::string& what) {
    const std::string message = what + " expects an integer, got '" + text + "'";
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range
        throw core::ValidationException(message);
    }
    if (consumed != text.size()) {
        throw core::ValidationException(message);
    }
    return value;
}

ParsedArgs ArgParser::parse(const std::vector<std::string>& args) const {
    ParsedArgs parsed;
    bool optionsDone = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (optionsDone || arg.size() < 2 || arg[0] != '-') {
            parsed.positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }
        if (arg == "-h") {
            parsed.flags.insert("help");
            continue;
        }
        if (arg.compare(0, 2, "--") != 0) {
            // Negative numbers and single-dash words are positionals
            parsed.positionals.push_back(arg);
            continue;
        }

        std::string name = arg.substr(2);
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            parsed.options[name.substr(0, eq)].push_back(name.substr(eq + 1));
            continue;
        }
        if (booleanFlags_.count(name) > 0) {
            parsed.flags.insert(name);
            continue;
        }
        if (i + 1 >= args.size()) {
            throw core::ValidationException("option --" + name + " requires a value");
        }
        parsed.options[name].push_back(args[++i]);
    }
    return parsed;
}

} // namespace planrunner::cli
