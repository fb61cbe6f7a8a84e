#pragma once
#include "soberlauncher/commandmachine.hpp"
#include <map>
#include <string>
#include <vector>

// Command handler implementations
namespace soberlauncher { namespace cli {
using commandmachine::option_map;

int
handle_list(const option_map& options, const std::vector<std::string>& subjects);

int
handle_launch(const option_map& options, const std::vector<std::string>& subjects);

int
handle_create(const option_map& options, const std::vector<std::string>& subjects);

int
handle_remove(const option_map& options, const std::vector<std::string>& subjects);

int
handle_fix(const option_map& options, const std::vector<std::string>& subjects);

int
handle_desktop_entry(const option_map& options, const std::vector<std::string>& subjects);

int
handle_quick(const option_map& options, const std::vector<std::string>& subjects);

int
handle_kill_all(const option_map& options, const std::vector<std::string>& subjects);

int
handle_settings(const option_map& options, const std::vector<std::string>& subjects);

int
handle_help(const option_map& options, const std::vector<std::string>& subjects);

} // namespace cli
} // namespace soberlauncher
