#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <string>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {

        // Profiles the user asked to run this session, in the order they were
        // first launched. Entries only leave on profile removal or clear().
        // missing() is what was launched but is not live anymore.
        class reconciliation_tracker
        {
        public:
            // true when the profile was not recorded yet
            bool record_launch(const std::string &profile);
            // true when the profile was recorded
            bool record_removal(const std::string &profile);
            void clear();

            bool contains(const std::string &profile) const;
            bool empty() const { return launched_.empty(); }
            const profile_list &launched() const { return launched_; }

            profile_list missing(const profile_set &live) const;

        private:
            profile_list launched_;
        };
    }
}
