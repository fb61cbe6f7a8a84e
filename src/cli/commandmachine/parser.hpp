// src/cli/commandmachine/parser.hpp
#pragma once
#include "soberlauncher/commandmachine.hpp"
#include <ostream>

namespace commandmachine {

/**
 * command_parser_impl - The concrete implementation of the command parser
 *
 * Syntax:
 * 1. Short (-c) and long (--console) options
 * 2. Combined flags (-jc)
 * 3. Values as -lvalue, -l=value, -l value, --link=value, --link value
 * 4. '--' ends option recognition
 * 5. Subject counts are checked against the command's bounds
 *
 * Errors never exit the process; they come back in parse_result::error.
 */
class command_parser_impl : public command_parser {
public:
    explicit command_parser_impl(std::string program_name);

    int
    parse(const std::vector<command>& commands, int argc, char* argv[]) override;

    parse_result
    tokenize(const std::vector<command>& commands,
             const std::vector<std::string>& args) override;

    void
    print_help(const std::vector<command>& commands, std::ostream& os) override;

private:
    const command*
    find_command(const std::vector<command>& commands, const std::string& name);

    const option_spec*
    find_short_option(const command& cmd, const std::string& short_name);

    const option_spec*
    find_long_option(const command& cmd, const std::string& long_name);

    // Stores an option, warning when it was already given
    void
    set_option(option_map& options, const std::string& name, const std::string& value);

    /**
     * short_options - Process a token of short options (without the '-')
     *
     * Flags may be combined; the first option that takes a value consumes
     * the rest of the token or, failing that, the next argument.
     *
     * @return false with result.error set on a usage error
     */
    bool
    short_options(const command& cmd, parse_result& result, const std::string& token,
                  size_t& i, const std::vector<std::string>& args);

    // --option, --option=value, --option value
    bool
    long_option(const command& cmd, parse_result& result, const std::string& token,
                size_t& i, const std::vector<std::string>& args);

    std::string program_name;  // Shown in help and error messages
};

} // namespace commandmachine
