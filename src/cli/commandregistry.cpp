#include "commandregistry.hpp"

std::vector<cm::command> command_registry = {
    {
        "list",
        soberlauncher::cli::handle_list,
        { {"json", "j", false} },
        "",
        "List profiles, main profile first",
        0, 0
    },
    {
        "launch",
        soberlauncher::cli::handle_launch,
        {
            {"link", "l", true},       // game link, turned into a deep link
            {"console", "c", false}
        },
        "PROFILE",
        "Launch profiles, each with its own HOME",
        1, -1
    },
    {
        "create",
        soberlauncher::cli::handle_create,
        { {"copy-main", "m", false} },
        "NAME",
        "Create a profile, optionally copying the main profile's data",
        1, 1
    },
    {
        "remove",
        soberlauncher::cli::handle_remove,
        {},
        "NAME",
        "Remove a profile and all of its data",
        1, 1
    },
    {
        "fix",
        soberlauncher::cli::handle_fix,
        {},
        "PROFILE",
        "Delete local files (.ld.so, .local, cache) of profiles",
        1, -1
    },
    {
        "desktop-entry",
        soberlauncher::cli::handle_desktop_entry,
        {},
        "PROFILE",
        "Write a .desktop launcher for a profile",
        1, 1
    },
    {
        "quick",
        soberlauncher::cli::handle_quick,
        {},
        "PARAMETER",
        "Launch with a parameter against the real HOME, untracked",
        1, 1
    },
    {
        "kill-all",
        soberlauncher::cli::handle_kill_all,
        {},
        "",
        "Kill every running instance",
        0, 0
    },
    {
        "settings",
        soberlauncher::cli::handle_settings,
        {
            {"multi-instance", "", true},  // on / off
            {"name", "", true}
        },
        "",
        "Show or change settings",
        0, 0
    },
    {
        "help",
        soberlauncher::cli::handle_help,
        {},
        "",
        "Show help information",
        0, 0
    }
};
