#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {

        // One way of asking the OS whether the application runs anywhere.
        // available() is the capability check (is the tool installed?),
        // detect() does the actual probing.
        struct instance_probe
        {
            std::string name;
            std::function<bool()> available;
            std::function<bool()> detect;
        };

        // flatpak ps, pgrep -af "flatpak run <identity>", ps -eo pid,cmd; in that order
        std::vector<instance_probe> default_instance_probes(const std::string &identity);

        /**
         * @brief Single-vs-multi instance launch guard.
         *
         * With multi-instance disabled a launch is refused when more than one
         * profile is requested, or when an instance of the application is
         * already running anywhere on the system (including ones started
         * outside this launcher).
         *
         * The guard is advisory and not atomic: nothing is locked between the
         * decision and the spawn, so two launches decided at the same time
         * from different places can both pass. The system probe is
         * best-effort too; probes that are missing or fail count as
         * "nothing detected".
         */
        class launch_policy
        {
        public:
            explicit launch_policy(std::vector<instance_probe> probes = {});

            void set_allow_multi_instance(bool allow);
            bool allow_multi_instance() const;

            // The rule itself, no probing
            bool can_launch(size_t requested_count, bool system_instance_detected) const;

            // Runs the probes in order, stopping at the first one that sees an
            // instance. Unavailable/failing probes are skipped.
            bool system_instance_detected() const;

            // Whole decision. Probes only run when their answer matters;
            // already_tracked counts as detected.
            bool evaluate(size_t requested_count, bool already_tracked = false) const;

        private:
            std::vector<instance_probe> probes_;
            bool allow_multi_ = false;
        };
    }
}
