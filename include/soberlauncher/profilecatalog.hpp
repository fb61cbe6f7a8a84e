#pragma once

#include "soberlauncher/util.hpp"
#include "soberlauncher/internalaliases.hpp"

#include <string>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {
        // The default profile. It always exists, always sorts first, can't be
        // removed and runs against the real $HOME.
        const std::string main_profile = "Main Profile";

        // A directory under the data root is a profile when it contains this
        // sub-directory.
        const std::string profile_marker = ".local";

        namespace profiles {
            bool is_main_profile(const std::string &name);

            // Natural order: names are split into alternating non-digit and
            // digit runs; digit runs compare numerically, the rest compare
            // case-insensitively. "Profile 2" < "Profile 10".
            bool natural_less(const std::string &a, const std::string &b);

            // Natural sort, then the main profile forced to the front exactly once.
            profile_list order(profile_list names);

            // Names of the directories under root that carry the marker.
            // A missing or unreadable root yields an empty list.
            profile_list scan(const std::string &root);

            // scan() + order(). Never empty: the main profile is always there.
            profile_list list(const std::string &root);

            // <root>/<name>
            std::string profile_path(const std::string &root, const std::string &name);

            // HOME override for a profile, empty for the main profile
            std::string home_for(const std::string &root, const std::string &name);
        }
    }
}
