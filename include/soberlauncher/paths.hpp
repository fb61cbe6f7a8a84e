#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <string>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {
        const std::string launcher_app_id = "org.taboulet.SoberLauncher";

        // Where profiles and SL_Settings.json live:
        //   in Flatpak:  $XDG_DATA_HOME/SoberLauncher or ~/.var/app/$FLATPAK_ID/data/SoberLauncher
        //   otherwise:   ~/.var/app/org.taboulet.SoberLauncher/data/SoberLauncher
        // Created if missing; no trailing slash.
        std::string resolve_data_root();

        std::string settings_path(const std::string &data_root);
    }
}
