#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <string>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

namespace soberlauncher {
    namespace management {
        namespace deeplink {
            const std::string scheme = "roblox";

            // Pulls the digits out of "games/<digits>" anywhere in a game URL,
            // e.g. https://www.roblox.com/games/12345/Name -> 12345
            bool parse_place_id(const std::string &url, std::string &place_id);

            // roblox://experience?placeId=<place_id>
            std::string build(const std::string &place_id);

            // parse_place_id() + build()
            bool from_game_link(const std::string &url, std::string &deep_link);
        }
    }
}
