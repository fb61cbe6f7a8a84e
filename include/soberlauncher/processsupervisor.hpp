#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <map>
#include <string>
#include <sys/types.h>
#include <vector>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {

        // What gets launched and how it is killed
        struct launch_target
        {
            std::vector<std::string> command;      // argv prefix
            std::string identity;                  // application id, used by probes and kill-all
            std::vector<std::string> kill_command; // kills every instance by identity

            // flatpak run org.vinegarhq.Sober
            static launch_target sober();
        };

        struct launch_options
        {
            // Appended verbatim as the last argument. Validating it is the
            // caller's job (see deeplink.hpp).
            std::string argument;
            // Run inside the first terminal emulator found
            bool with_console = false;
        };

        enum class launch_status
        {
            launched,
            already_running,
            spawn_failed
        };

        struct launch_result
        {
            launch_status status = launch_status::spawn_failed;
            pid_t pid = 0;
            std::string error;

            bool ok() const { return status != launch_status::spawn_failed; }
        };

        // argv plus the HOME override (empty: inherit the real environment)
        struct invocation
        {
            std::vector<std::string> argv;
            std::string home;
        };

        // konsole -e, x-terminal-emulator -e or gnome-terminal --; empty if none
        std::vector<std::string> find_terminal_prefix();

        /**
         * @brief Owns the profile -> process mapping.
         *
         * Every tracked process is a direct child started with fork/exec, in
         * its own process group. Liveness is observed, never pushed: poll()
         * has to be called periodically and everything else reports the state
         * seen by the last poll. The window between a process exiting and
         * is_live() turning false is therefore one poll interval.
         *
         * Not thread-safe; use it from one thread only.
         */
        class process_supervisor
        {
        public:
            explicit process_supervisor(std::string profiles_root,
                                        launch_target target = launch_target::sober());

            process_supervisor(const process_supervisor &) = delete;
            process_supervisor &operator=(const process_supervisor &) = delete;

            // Starts the profile unless its current process is still alive
            // (checked right here, not from the last poll). A failed spawn
            // leaves the mapping untouched.
            launch_result launch(const std::string &profile, const launch_options &options = {});

            // Reaps every tracked process that has exited and drops it from
            // the mapping. Returns the profiles dropped in this call.
            profile_set poll();

            // Runs the kill-all command for the application identity, then
            // terminates and reaps every tracked process and clears the mapping.
            void terminate_all();

            // Terminates one profile's process (if any) and stops tracking it
            bool forget(const std::string &profile);

            // As of the last poll(); an exit is only seen by the next one
            bool is_live(const std::string &profile) const;
            profile_set live_profiles() const;
            bool any_live() const;

            invocation build_invocation(const std::string &profile, const launch_options &options = {}) const;

            // env HOME="<dir>" flatpak run org.vinegarhq.Sober ["<argument>"]
            std::string shell_command_line(const std::string &profile, const std::string &argument = "") const;

            // Fire and forget against the real environment: double-forked,
            // not tracked, nobody has to reap it.
            launch_result spawn_detached(const std::string &argument) const;

            // Same environment as launch(), but double-forked and not tracked
            launch_result launch_detached(const std::string &profile, const launch_options &options = {}) const;

            const launch_target &target() const { return target_; }
            const std::string &root() const { return profiles_root_; }

        private:
            std::string profiles_root_;
            launch_target target_;
            std::map<std::string, pid_t> live_;
        };
    }
}
