#ifndef PLANRUNNER_CLI_ARG_PARSER_H
#define PLANRUNNER_CLI_ARG_PARSER_H

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace planrunner::cli {

/**
 * @brief Parsed command line: positionals, repeatable options and flags
 */
struct ParsedArgs {
    std::vector<std::string> positionals;
    std::map<std::string, std::vector<std::string>> options;
    std::set<std::string> flags;

    bool has(const std::string& name) const { return flags.count(name) > 0 || options.count(name) > 0; }

    /**
     * @brief Last value given for an option
     */
    std::optional<std::string> value(const std::string& name) const;

    std::vector<std::string> values(const std::string& name) const;

    /**
     * @throws ValidationException if the value is not an integer
     */
    std::optional<int> intValue(const std::string& name) const;

    std::optional<std::string> positional(size_t index) const;
};

/**
 * @brief Minimal GNU-style parser
 *
 * Accepts `--name value`, `--name=value` and boolean `--flag`. Everything
 * after `--` is positional. Which names are flags must be declared.
 */
class ArgParser {
public:
    explicit ArgParser(std::set<std::string> booleanFlags);

    /**
     * @throws ValidationException for an option without a value
     */
    ParsedArgs parse(const std::vector<std::string>& args) const;

    /**
     * @throws ValidationException naming `what` if text is not an integer
     */
    static int parseInt(const std::string& text, const std::string& what);

private:
    std::set<std::string> booleanFlags_;
};

} // namespace planrunner::cli

#endif // PLANRUNNER_CLI_ARG_PARSER_H
