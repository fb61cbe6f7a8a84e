#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <string>
#include <vector>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {

        struct private_server
        {
            std::string name;
            std::string parameter;
        };

        /**
         * @brief In-memory form of SL_Settings.json.
         *
         * Validated once when loaded: a missing or wrongly typed field takes
         * the default below, malformed private server entries are dropped,
         * and the poll interval is clamped into its range.
         */
        struct settings_record
        {
            static constexpr int current_version = 1;
            static constexpr int min_poll_interval_ms = 250;
            static constexpr int max_poll_interval_ms = 60000;

            int version = current_version;
            std::string display_name = "[Name]";
            std::vector<private_server> private_servers;
            bool roblox_player_enabled = false;
            bool allow_multi_instance = false;
            int poll_interval_ms = 2000;
        };

        namespace settings {
            // JSON text -> record. Unparseable text gives the defaults and a
            // warning; ok is false in that case.
            settings_record parse(const std::string &json_text, bool &ok, std::string &warning);

            std::string serialize(const settings_record &record);

            // Reads path. A missing file is created with the defaults; an
            // unreadable or broken one is left alone and the defaults are used.
            settings_record load(const std::string &path);

            bool save(const settings_record &record, const std::string &path, std::string &error);

            // Private server list helpers (names are the keys)
            bool add_private_server(settings_record &record, const std::string &name, const std::string &parameter);
            bool edit_private_server(settings_record &record,
                                     const std::string &old_name,
                                     const std::string &new_name,
                                     const std::string &new_parameter);
            bool remove_private_server(settings_record &record, const std::string &name);
        }
    }
}
