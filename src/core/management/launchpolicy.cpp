#include "soberlauncher/launchpolicy.hpp"
#include "soberlauncher/debug.hpp"
#include "soberlauncher/util.hpp"

#include <exception>
#include <iostream>
#include <utility>

std::vector<sl_mgmt::instance_probe>
sl_mgmt::default_instance_probes(const std::string &identity)
{
    std::vector<instance_probe> probes;

    // 1. Flatpak's own instance list
    probes.push_back({
        "flatpak ps",
        [] { return sl_util::command_exists("flatpak"); },
        [identity] {
            command_streams res = sl_util::exec_command("flatpak", "ps");
            return res.exit_status == 0 && res.stdout_str.find(identity) != std::string::npos;
        }
    });

    // 2. A "flatpak run <identity>" somewhere in the process table
    probes.push_back({
        "pgrep",
        [] { return sl_util::command_exists("pgrep"); },
        [identity] {
            command_streams res = sl_util::exec_command("pgrep", "-af", "flatpak run " + identity);
            return res.exit_status == 0 && !sl_util::trim_string(res.stdout_str).empty();
        }
    });

    // 3. Any command line mentioning the identity
    probes.push_back({
        "ps",
        [] { return sl_util::command_exists("ps"); },
        [identity] {
            command_streams res = sl_util::exec_command("ps", "-eo", "pid,cmd");
            return res.exit_status == 0 && res.stdout_str.find(identity) != std::string::npos;
        }
    });

    return probes;
}

sl_mgmt::launch_policy::launch_policy(std::vector<instance_probe> probes)
    : probes_(std::move(probes))
{
}

void
sl_mgmt::launch_policy::set_allow_multi_instance(bool allow)
{
    allow_multi_ = allow;
}

bool
sl_mgmt::launch_policy::allow_multi_instance() const
{
    return allow_multi_;
}

bool
sl_mgmt::launch_policy::can_launch(size_t requested_count, bool system_instance_detected) const
{
    if (allow_multi_)
        return true;

    if (requested_count > 1)
        return false;

    return !system_instance_detected;
}

bool
sl_mgmt::launch_policy::system_instance_detected() const
{
    for (const auto &probe : probes_) {
        if (!probe.detect)
            continue;

        try {
            if (probe.available && !probe.available()) {
                DEBUG_LOG("[policy] probe unavailable: ", probe.name);
                continue;
            }
            if (probe.detect()) {
                DEBUG_LOG("[policy] instance detected by ", probe.name);
                return true;
            }
        } catch (const std::exception &e) {
            // A broken probe is just a probe that saw nothing
            std::cerr << "Warning: instance probe '" << probe.name
                      << "' failed: " << e.what() << std::endl;
        }
    }

    return false;
}

bool
sl_mgmt::launch_policy::evaluate(size_t requested_count, bool already_tracked) const
{
    // Decided without probing
    if (allow_multi_)
        return true;
    if (requested_count > 1)
        return false;
    if (already_tracked)
        return can_launch(requested_count, true);

    return can_launch(requested_count, system_instance_detected());
}
