// src/cli/commandmachine/parser.cpp
#include "soberlauncher/commandmachine.hpp"
#include "soberlauncher/debug.hpp"
#include "parser.hpp"
#include <iostream>
#include <utility>

using cpi = commandmachine::command_parser_impl;
using commandmachine::command;
using commandmachine::command_parser;
using commandmachine::option_map;
using commandmachine::option_spec;
using commandmachine::parse_result;

cpi::command_parser_impl(std::string program_name)
    : program_name(std::move(program_name))
{
}

int
cpi::parse(const std::vector<command>& commands, int argc, char* argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (args.empty()) {
        print_help(commands, std::cerr);
        return 1;
    }

    parse_result result = tokenize(commands, args);
    if (!result.ok) {
        std::cerr << "Error: " << result.error << "\n";
        if (!result.cmd) {
            std::cerr << "\n";
            print_help(commands, std::cerr);
        }
        return 1;
    }

    // help
    if (!result.cmd) {
        print_help(commands, std::cout);
        return 0;
    }

    DEBUG_LOG("[cli] running ", result.cmd->name, " with ", result.subjects);
    return result.cmd->handler(result.options, result.subjects);
}

parse_result
cpi::tokenize(const std::vector<command>& commands, const std::vector<std::string>& args)
{
    parse_result result;

    // Global options come before the command; only help is known
    size_t first = 0;
    if (first < args.size() && args[first].size() > 1 && args[first][0] == '-') {
        if (args[first] == "-h" || args[first] == "--help") {
            result.ok = true;
            return result;
        }
        result.error = "Unrecognized global option '" + args[first] + "'";
        return result;
    }

    if (first >= args.size()) {
        result.error = "No action specified";
        return result;
    }

    const std::string& command_name = args[first];
    if (command_name == "help") {
        result.ok = true;
        return result;
    }

    const command* cmd = find_command(commands, command_name);
    if (!cmd) {
        result.error = "Unknown command '" + command_name + "'";
        return result;
    }

    bool end_of_options = false;
    for (size_t i = first + 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!end_of_options && arg == "--") {
            end_of_options = true;
            continue;
        }

        if (!end_of_options && arg.size() > 1 && arg[0] == '-') {
            bool ok = (arg[1] == '-')
                ? long_option(*cmd, result, arg.substr(2), i, args)
                : short_options(*cmd, result, arg.substr(1), i, args);
            if (!ok) {
                result.cmd = cmd;
                return result;
            }
        } else {
            result.subjects.push_back(arg);
        }
    }

    result.cmd = cmd;

    int count = static_cast<int>(result.subjects.size());
    if (cmd->min_subjects > 0 && count < cmd->min_subjects) {
        result.error = "command '" + cmd->name + "' requires at least " +
                       std::to_string(cmd->min_subjects) + " " + cmd->subject_name + "(s)";
        return result;
    }
    if (cmd->max_subjects >= 0 && count > cmd->max_subjects) {
        result.error = cmd->max_subjects == 0
            ? "command '" + cmd->name + "' takes no arguments"
            : "command '" + cmd->name + "' accepts at most " +
              std::to_string(cmd->max_subjects) + " " + cmd->subject_name + "(s)";
        return result;
    }

    result.ok = true;
    return result;
}

const command*
cpi::find_command(const std::vector<command>& commands, const std::string& name)
{
    for (const auto& cmd : commands) {
        if (cmd.name == name) {
            return &cmd;
        }
    }
    return nullptr;
}

const option_spec*
cpi::find_short_option(const command& cmd, const std::string& short_name)
{
    for (const auto& spec : cmd.allowed_options) {
        if (!spec.short_name.empty() && spec.short_name == short_name) {
            return &spec;
        }
    }
    return nullptr;
}

const option_spec*
cpi::find_long_option(const command& cmd, const std::string& long_name)
{
    for (const auto& spec : cmd.allowed_options) {
        if (spec.long_name == long_name) {
            return &spec;
        }
    }
    return nullptr;
}

void
cpi::set_option(option_map& options, const std::string& name, const std::string& value)
{
    if (options.find(name) != options.end()) {
        std::cerr << "Warning: Option '" << name
                  << "' defined multiple times. Using last definition.\n";
    }
    options[name] = value;
}

bool
cpi::short_options(const command& cmd, parse_result& result, const std::string& token,
                   size_t& i, const std::vector<std::string>& args)
{
    // "-l=value": one option only
    size_t eq_pos = token.find('=');
    if (eq_pos != std::string::npos) {
        if (eq_pos != 1) {
            result.error = "Equals syntax needs exactly one short option in '-" + token + "'";
            return false;
        }
        const option_spec* spec = find_short_option(cmd, token.substr(0, 1));
        if (!spec) {
            result.error = "Unrecognized option '-" + token.substr(0, 1) + "'";
            return false;
        }
        if (!spec->requires_value) {
            result.error = "Option '--" + spec->long_name + "' takes no value";
            return false;
        }
        set_option(result.options, spec->long_name, token.substr(eq_pos + 1));
        return true;
    }

    for (size_t j = 0; j < token.size(); ++j) {
        const option_spec* spec = find_short_option(cmd, std::string(1, token[j]));
        if (!spec) {
            result.error = "Unrecognized option '-" + std::string(1, token[j]) + "'";
            return false;
        }

        if (!spec->requires_value) {
            set_option(result.options, spec->long_name, flag_set);
            continue;
        }

        // Rest of the token (-lvalue), otherwise the next argument
        std::string value;
        if (j + 1 < token.size()) {
            value = token.substr(j + 1);
        } else if (i + 1 < args.size() && args[i + 1] != "--" &&
                   !args[i + 1].empty() && args[i + 1][0] != '-') {
            value = args[++i];
        } else {
            result.error = "Option '-" + spec->short_name + "' requires a value";
            return false;
        }

        set_option(result.options, spec->long_name, value);
        return true;
    }

    return true;
}

bool
cpi::long_option(const command& cmd, parse_result& result, const std::string& token,
                 size_t& i, const std::vector<std::string>& args)
{
    auto strip_quotes = [](const std::string& s) -> std::string {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            return s.substr(1, s.size() - 2);
        }
        return s;
    };

    size_t eq_pos = token.find('=');
    std::string name = token.substr(0, eq_pos);

    const option_spec* spec = find_long_option(cmd, name);
    if (!spec) {
        result.error = "Unrecognized option '--" + name + "'";
        return false;
    }

    if (!spec->requires_value) {
        if (eq_pos != std::string::npos) {
            result.error = "Option '--" + name + "' takes no value";
            return false;
        }
        set_option(result.options, spec->long_name, flag_set);
        return true;
    }

    std::string value;
    if (eq_pos != std::string::npos) {
        value = strip_quotes(token.substr(eq_pos + 1));
    } else if (i + 1 < args.size() && args[i + 1] != "--" &&
               !args[i + 1].empty() && args[i + 1][0] != '-') {
        value = strip_quotes(args[++i]);
    }

    if (value.empty()) {
        result.error = "Option '--" + name + "' requires a value";
        return false;
    }

    set_option(result.options, spec->long_name, value);
    return true;
}

void
cpi::print_help(const std::vector<command>& commands, std::ostream& os)
{
    os << "Usage: " << program_name << " <command> [options] [--] [<subject> ...]\n\n";
    os << "Commands:\n";

    for (const auto& cmd : commands) {
        os << "  " << cmd.name;
        if (!cmd.subject_name.empty()) {
            os << " " << (cmd.min_subjects > 0 ? "" : "[") << cmd.subject_name
               << (cmd.max_subjects != 1 ? "..." : "") << (cmd.min_subjects > 0 ? "" : "]");
        }
        os << "\n";
        os << "    " << cmd.description << "\n";

        for (const auto& opt : cmd.allowed_options) {
            os << "      ";
            if (!opt.short_name.empty()) {
                os << "-" << opt.short_name << ", ";
            }
            os << "--" << opt.long_name;
            if (opt.requires_value) {
                os << "=VALUE";
            }
            os << "\n";
        }
    }

    os << "\nSyntax reference:\n";
    os << "  Use '--' to separate options from subjects\n";
    os << "  Combine short flags: -jc\n";
    os << "  Values: -kvalue, -k=value, -k value, --option=value\n";
}

/**
 * command_parser::create - Factory method for creating parser instances
 */
std::unique_ptr<command_parser>
commandmachine::command_parser::create(const std::string& program_name)
{
    return std::make_unique<command_parser_impl>(program_name);
}
