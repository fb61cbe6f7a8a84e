#include "soberlauncher/deeplink.hpp"
#include "soberlauncher/debug.hpp"
#include "soberlauncher/launchpolicy.hpp"
#include "soberlauncher/paths.hpp"
#include "soberlauncher/processsupervisor.hpp"
#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/profiledata.hpp"
#include "soberlauncher/settings.hpp"
#include "soberlauncher/util.hpp"
#include "handlers.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace {

bool
profile_exists(const std::string &root, const std::string &name)
{
    profile_list all = sl_mgmt::profiles::list(root);
    return std::find(all.begin(), all.end(), name) != all.end();
}

} // namespace

// Command handler implementations
int
soberlauncher::cli::handle_list(const option_map& options,
                                const std::vector<std::string>& subjects)
{
    bool json_output = options.find("json") != options.end();
    profile_list names = sl_mgmt::profiles::list(sl_mgmt::resolve_data_root());

    if (json_output) {
        std::cout << "[";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << "{\"name\": \"" << sl_util::json_escape(names[i]) << "\", "
                      << "\"main\": " << (sl_mgmt::profiles::is_main_profile(names[i]) ? "true" : "false")
                      << "}";
        }
        std::cout << "]" << std::endl;
        return 0;
    }

    for (const auto &name : names)
        std::cout << name << std::endl;
    return 0;
}

/*
  The CLI exits right after launching, so instances are started detached
  and nothing supervises them. The multi-instance guard still applies: it
  only looks at the system, which is all a short-lived process can see.
*/
int
soberlauncher::cli::handle_launch(const option_map& options,
                                  const std::vector<std::string>& subjects)
{
    std::string root = sl_mgmt::resolve_data_root();
    sl_mgmt::settings_record settings = sl_mgmt::settings::load(sl_mgmt::settings_path(root));

    for (const auto &profile : subjects) {
        if (!profile_exists(root, profile)) {
            std::cerr << "Error: no profile named '" << profile << "'" << std::endl;
            return 1;
        }
    }

    sl_mgmt::launch_options launch_opts;
    launch_opts.with_console = options.find("console") != options.end();

    auto link = options.find("link");
    if (link != options.end() && !sl_mgmt::deeplink::from_game_link(link->second, launch_opts.argument)) {
        std::cerr << "Error: invalid game link '" << link->second << "'" << std::endl;
        return 1;
    }

    sl_mgmt::launch_target target = sl_mgmt::launch_target::sober();
    sl_mgmt::launch_policy policy(sl_mgmt::default_instance_probes(target.identity));
    policy.set_allow_multi_instance(settings.allow_multi_instance);

    if (!policy.evaluate(subjects.size())) {
        std::cerr << "Error: multi-instance is disabled; launch a single profile "
                     "and close any running instance first" << std::endl;
        return 1;
    }

    sl_mgmt::process_supervisor supervisor(root, target);
    int status = 0;
    for (const auto &profile : subjects) {
        sl_mgmt::launch_result r = supervisor.launch_detached(profile, launch_opts);
        if (r.ok()) {
            std::cout << "Launched " << profile << std::endl;
        } else {
            std::cerr << "Failed to launch " << profile << ": " << r.error << std::endl;
            status = 1;
        }
    }
    return status;
}

int
soberlauncher::cli::handle_create(const option_map& options,
                                  const std::vector<std::string>& subjects)
{
    std::string root = sl_mgmt::resolve_data_root();
    const std::string &name = subjects[0];
    std::string error;

    if (!sl_mgmt::profiles::create_profile(root, name, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    std::cout << "Created profile " << name << std::endl;

    if (options.find("copy-main") != options.end()) {
        std::string identity = sl_mgmt::launch_target::sober().identity;
        std::string src = sl_mgmt::profiles::app_data_dir(root, sl_mgmt::main_profile, identity);

        std::cout << "Copying " << src << "..." << std::endl;
        if (!sl_mgmt::profiles::copy_main_profile_data(src, sl_mgmt::profiles::profile_path(root, name), error)) {
            std::cerr << "Error: copy failed: " << error << std::endl;
            return 1;
        }
        std::cout << "Copied the main profile's data" << std::endl;
    }

    return 0;
}

int
soberlauncher::cli::handle_remove(const option_map& options,
                                  const std::vector<std::string>& subjects)
{
    std::string error;
    if (!sl_mgmt::profiles::remove_profile(sl_mgmt::resolve_data_root(), subjects[0], error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    std::cout << "Removed profile " << subjects[0] << std::endl;
    return 0;
}

int
soberlauncher::cli::handle_fix(const option_map& options,
                               const std::vector<std::string>& subjects)
{
    std::string root = sl_mgmt::resolve_data_root();
    std::string identity = sl_mgmt::launch_target::sober().identity;
    int status = 0;

    for (const auto &profile : subjects) {
        if (!profile_exists(root, profile)) {
            std::cerr << "Error: no profile named '" << profile << "'" << std::endl;
            status = 1;
            continue;
        }

        std::vector<std::string> errors;
        if (sl_mgmt::profiles::fix_profile(root, profile, identity, errors)) {
            std::cout << "Fixed " << profile << std::endl;
        } else {
            for (const auto &e : errors)
                std::cerr << profile << ": " << e << std::endl;
            status = 1;
        }
    }
    return status;
}

int
soberlauncher::cli::handle_desktop_entry(const option_map& options,
                                         const std::vector<std::string>& subjects)
{
    std::string root = sl_mgmt::resolve_data_root();
    const std::string &profile = subjects[0];

    if (!profile_exists(root, profile)) {
        std::cerr << "Error: no profile named '" << profile << "'" << std::endl;
        return 1;
    }

    sl_mgmt::process_supervisor supervisor(root);
    std::string written, error;
    if (!sl_mgmt::profiles::write_desktop_entry(profile,
                                                sl_mgmt::profiles::desktop_entry_dir(),
                                                supervisor.shell_command_line(profile),
                                                sl_mgmt::launcher_app_id,
                                                written, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    std::cout << "Desktop entry created: " << written << std::endl;
    return 0;
}

int
soberlauncher::cli::handle_quick(const option_map& options,
                                 const std::vector<std::string>& subjects)
{
    sl_mgmt::process_supervisor supervisor(sl_mgmt::resolve_data_root());
    sl_mgmt::launch_result r = supervisor.spawn_detached(subjects[0]);
    if (!r.ok()) {
        std::cerr << "Error: " << r.error << std::endl;
        return 1;
    }
    std::cout << "Launched " << subjects[0] << std::endl;
    return 0;
}

int
soberlauncher::cli::handle_kill_all(const option_map& options,
                                    const std::vector<std::string>& subjects)
{
    sl_mgmt::process_supervisor supervisor(sl_mgmt::resolve_data_root());
    supervisor.terminate_all();
    std::cout << "Killed every instance of " << supervisor.target().identity << std::endl;
    return 0;
}

int
soberlauncher::cli::handle_settings(const option_map& options,
                                    const std::vector<std::string>& subjects)
{
    std::string path = sl_mgmt::settings_path(sl_mgmt::resolve_data_root());
    sl_mgmt::settings_record settings = sl_mgmt::settings::load(path);
    bool changed = false;

    auto multi = options.find("multi-instance");
    if (multi != options.end()) {
        std::string value = sl_util::to_lower(multi->second);
        if (value == "on" || value == "true" || value == "1") {
            settings.allow_multi_instance = true;
        } else if (value == "off" || value == "false" || value == "0") {
            settings.allow_multi_instance = false;
        } else {
            std::cerr << "Error: --multi-instance expects on or off" << std::endl;
            return 1;
        }
        changed = true;
    }

    auto name = options.find("name");
    if (name != options.end()) {
        settings.display_name = name->second;
        changed = true;
    }

    if (changed) {
        std::string error;
        if (!sl_mgmt::settings::save(settings, path, error)) {
            std::cerr << "Error: could not save " << path << ": " << error << std::endl;
            return 1;
        }
    }

    std::cout << "Settings file:   " << path << "\n"
              << "Name:            " << settings.display_name << "\n"
              << "Multi-instance:  " << (settings.allow_multi_instance ? "on" : "off") << "\n"
              << "Poll interval:   " << settings.poll_interval_ms << " ms\n"
              << "Private servers: " << settings.private_servers.size() << std::endl;
    for (const auto &s : settings.private_servers)
        std::cout << "  " << s.name << ": " << s.parameter << std::endl;

    return 0;
}

int
soberlauncher::cli::handle_help(const option_map& options,
                                const std::vector<std::string>& subjects)
{
    // Help is handled by the parser
    return 0;
}
