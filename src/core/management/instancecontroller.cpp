#include "soberlauncher/instancecontroller.hpp"
#include "soberlauncher/deeplink.hpp"
#include "soberlauncher/profiledata.hpp"
#include "soberlauncher/debug.hpp"

#include <utility>

std::string
sl_mgmt::describe(request_status status)
{
    switch (status) {
        case request_status::ok:
            return "OK";
        case request_status::no_selection:
            return "No profile selected.";
        case request_status::rejected_by_policy:
            return "Multi-instance is disabled: launch only one profile and close any running instance first.";
        case request_status::invalid_link:
            return "Invalid game link: expected something like https://www.roblox.com/games/<place id>/...";
        case request_status::multi_instance_disabled:
            return "Running missing profiles needs multi-instance to be enabled.";
        case request_status::nothing_missing:
            return "Every launched profile is running.";
        case request_status::spawn_failures:
            return "Some profiles could not be launched.";
    }
    return "Unknown status";
}

sl_mgmt::instance_controller::instance_controller(settings_record &settings,
                                                  std::string profiles_root,
                                                  launch_target target,
                                                  std::vector<instance_probe> probes)
    : settings_(settings)
    , supervisor_(std::move(profiles_root), std::move(target))
    , policy_(std::move(probes))
{
    policy_.set_allow_multi_instance(settings_.allow_multi_instance);
}

sl_mgmt::launch_report
sl_mgmt::instance_controller::launch_targets(const profile_list &targets, const launch_options &options)
{
    launch_report report;

    for (const auto &profile : targets) {
        launch_result r = supervisor_.launch(profile, options);

        switch (r.status) {
            case launch_status::launched:
                report.launched.push_back(profile);
                tracker_.record_launch(profile);
                break;
            case launch_status::already_running:
                report.already_running.push_back(profile);
                tracker_.record_launch(profile);
                break;
            case launch_status::spawn_failed:
                report.failures[profile] = r.error;
                break;
        }
    }

    if (!report.failures.empty())
        report.status = request_status::spawn_failures;

    DEBUG_LOG("[controller] launched ", report.launched, " already running ", report.already_running,
              " failed ", report.failures.size());
    return report;
}

sl_mgmt::launch_report
sl_mgmt::instance_controller::launch(const profile_list &profiles, const launch_options &options)
{
    launch_report report;

    if (profiles.empty()) {
        report.status = request_status::no_selection;
        return report;
    }

    // The flag may have been flipped since the last decision
    policy_.set_allow_multi_instance(settings_.allow_multi_instance);
    if (!policy_.evaluate(profiles.size(), supervisor_.any_live())) {
        DEBUG_LOG("[controller] policy rejected ", profiles);
        report.status = request_status::rejected_by_policy;
        return report;
    }

    return launch_targets(profiles, options);
}

sl_mgmt::launch_report
sl_mgmt::instance_controller::launch_with_link(const profile_list &profiles,
                                               const std::string &game_link,
                                               bool with_console)
{
    launch_options options;
    options.with_console = with_console;

    if (!deeplink::from_game_link(game_link, options.argument)) {
        launch_report report;
        report.status = request_status::invalid_link;
        return report;
    }

    return launch(profiles, options);
}

sl_mgmt::launch_report
sl_mgmt::instance_controller::run_missing(const std::string &argument)
{
    launch_report report;

    if (!settings_.allow_multi_instance) {
        report.status = request_status::multi_instance_disabled;
        return report;
    }

    profile_list targets = missing();
    if (targets.empty()) {
        report.status = request_status::nothing_missing;
        return report;
    }

    launch_options options;
    options.argument = argument;
    return launch(targets, options);
}

sl_mgmt::launch_report
sl_mgmt::instance_controller::run_missing_with_link(const std::string &game_link)
{
    if (!settings_.allow_multi_instance) {
        launch_report report;
        report.status = request_status::multi_instance_disabled;
        return report;
    }

    std::string deep_link;
    if (!deeplink::from_game_link(game_link, deep_link)) {
        launch_report report;
        report.status = request_status::invalid_link;
        return report;
    }

    return run_missing(deep_link);
}

sl_mgmt::tick_report
sl_mgmt::instance_controller::tick()
{
    tick_report report;
    report.exited = supervisor_.poll();
    report.missing = missing();
    return report;
}

profile_list
sl_mgmt::instance_controller::missing() const
{
    return tracker_.missing(supervisor_.live_profiles());
}

void
sl_mgmt::instance_controller::exit_all()
{
    supervisor_.terminate_all();
    tracker_.clear();
}

bool
sl_mgmt::instance_controller::remove_profile(const std::string &profile, std::string &error)
{
    if (!profiles::remove_profile(supervisor_.root(), profile, error))
        return false;

    supervisor_.forget(profile);
    tracker_.record_removal(profile);
    return true;
}
