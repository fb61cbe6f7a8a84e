#pragma once

#include "soberlauncher/launchpolicy.hpp"
#include "soberlauncher/processsupervisor.hpp"
#include "soberlauncher/reconciliation.hpp"
#include "soberlauncher/settings.hpp"
#include "soberlauncher/internalaliases.hpp"

#include <map>
#include <string>
#include <vector>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {

        enum class request_status
        {
            ok,
            no_selection,
            rejected_by_policy,
            invalid_link,
            multi_instance_disabled,
            nothing_missing,
            spawn_failures     // at least one target failed to spawn
        };

        struct launch_report
        {
            request_status status = request_status::ok;
            profile_list launched;          // spawned by this request
            profile_list already_running;   // were alive, left alone
            std::map<std::string, std::string> failures; // profile -> reason

            bool ok() const { return status == request_status::ok; }
        };

        struct tick_report
        {
            profile_set exited;     // dropped by this poll
            profile_list missing;   // launched this session, not live
        };

        // Human readable text for a non-ok status
        std::string describe(request_status status);

        /**
         * @brief Ties policy, supervisor and tracker together.
         *
         * One instance per process, created by the front end and handed
         * around by reference. Everything runs on the caller's thread; the
         * front end is expected to call tick() every poll_interval_ms().
         *
         * The settings record is borrowed: the multi-instance flag is read
         * again on every launch decision.
         */
        class instance_controller
        {
        public:
            instance_controller(settings_record &settings,
                                std::string profiles_root,
                                launch_target target,
                                std::vector<instance_probe> probes);

            launch_report launch(const profile_list &profiles, const launch_options &options = {});
            launch_report launch_with_link(const profile_list &profiles, const std::string &game_link,
                                           bool with_console = false);

            // Relaunch whatever is missing. Multi-instance only.
            launch_report run_missing(const std::string &argument = "");
            launch_report run_missing_with_link(const std::string &game_link);

            tick_report tick();

            profile_list missing() const;
            profile_set live_profiles() const { return supervisor_.live_profiles(); }
            const profile_list &launched_profiles() const { return tracker_.launched(); }
            bool is_live(const std::string &profile) const { return supervisor_.is_live(profile); }

            // Kill every instance and forget the session
            void exit_all();

            // Deletes the profile directory; on success its process and
            // session entry go too.
            bool remove_profile(const std::string &profile, std::string &error);

            int poll_interval_ms() const { return settings_.poll_interval_ms; }

            process_supervisor &supervisor() { return supervisor_; }
            const launch_policy &policy() const { return policy_; }
            const reconciliation_tracker &tracker() const { return tracker_; }

        private:
            launch_report launch_targets(const profile_list &targets, const launch_options &options);

            settings_record &settings_;
            process_supervisor supervisor_;
            launch_policy policy_;
            reconciliation_tracker tracker_;
        };
    }
}
