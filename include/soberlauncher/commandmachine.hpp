// commandmachine.hpp - Agnostic command parsing machinery
#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace commandmachine {

// Value stored for options given without one
const std::string flag_set = "<default>";

// Option specification structure
struct option_spec {
    std::string long_name;   // e.g. "multi-instance"
    std::string short_name;  // e.g. "m" (empty if no short form)
    bool requires_value;
};

using option_map = std::map<std::string, std::string>;

// command handler type
using command_handler = std::function<int(const option_map&, const std::vector<std::string>&)>;

// command metadata structure
struct command {
    std::string name;
    command_handler handler;
    std::vector<option_spec> allowed_options;
    std::string subject_name;
    std::string description;
    int min_subjects = 1;
    int max_subjects = -1;
};

// Parse outcome, kept around for callers (and tests) that want to look at it
struct parse_result {
    bool ok = false;
    const command *cmd = nullptr;   // null for help or on error
    option_map options;
    std::vector<std::string> subjects;
    std::string error;
};

// Parser interface
class command_parser {
public:
    virtual ~command_parser() = default;

    // Parses argv and runs the matched handler. Returns the handler's
    // status, 0 for help and 1 for a usage error.
    virtual int parse(const std::vector<command>& commands, int argc, char* argv[]) = 0;

    // Parsing only; nothing is run and nothing is printed
    virtual parse_result tokenize(const std::vector<command>& commands,
                                  const std::vector<std::string>& args) = 0;

    virtual void print_help(const std::vector<command>& commands, std::ostream& os) = 0;

    /**
    * command_parser::create - Factory method for creating parser instances
    *
    * @param program_name Shown in the usage line
    * @return Unique pointer to a new parser instance
    */
    static std::unique_ptr<command_parser> create(const std::string& program_name);
};

} // namespace commandmachine
