#pragma once
#include "soberlauncher/internalaliases.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

// Struct to hold command output streams
struct command_streams
{
    std::string stdout_str;
    std::string stderr_str;
    // -1 when the command could not be run at all (pipe/fork failure)
    int exit_status = -1;
};

namespace soberlauncher {
    namespace __util__ {
        // Check if a command exists in the system PATH
        bool command_exists(const std::string& command);

        // --- Execute a command and capture its output ---

        // Execvp mode: pass argv-style arguments (vector form)
        command_streams exec_commandv(const std::vector<std::string> &args);

        // Variadic wrapper (template)
        template<typename... Args>
        command_streams
        exec_command(std::string_view file, Args&&... args)
        {
            static_assert((std::is_constructible<std::string, Args>::value && ...),
                        "All exec_command() arguments must be convertible to std::string");

            std::vector<std::string> argv;
            argv.reserve(1 + sizeof...(Args));
            argv.emplace_back(file);
            (argv.emplace_back(std::forward<Args>(args)), ...);
            return exec_commandv(argv);
        }

        // Mark a descriptor close-on-exec
        void set_cloexec(int fd);

        // Check if path exists and is a directory
        bool
        is_directory (const std::string& path);

        // Trim whitespace from string
        std::string
        trim_string (const std::string& str);

        // Convert string to lowercase
        std::string
        to_lower (const std::string& str);

        // Get a binary full path
        std::string
        which(const std::string &program);

        // $HOME, falling back to the passwd entry
        std::string
        home_directory();

        std::string
        json_escape (const std::string &s);

        // Wrap in double quotes unless already quoted
        std::string
        quote_if_needed(const std::string &input);
    }
}
