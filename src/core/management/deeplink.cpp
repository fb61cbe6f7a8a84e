#include "soberlauncher/deeplink.hpp"
#include "soberlauncher/util.hpp"

#include <regex>

bool
sl_mgmt::deeplink::parse_place_id(const std::string &url, std::string &place_id)
{
    static const std::regex game_pattern(R"(games/(\d+))");

    std::string trimmed = sl_util::trim_string(url);
    std::smatch match;
    if (!std::regex_search(trimmed, match, game_pattern))
        return false;

    place_id = match[1].str();
    return true;
}

std::string
sl_mgmt::deeplink::build(const std::string &place_id)
{
    return scheme + "://experience?placeId=" + place_id;
}

bool
sl_mgmt::deeplink::from_game_link(const std::string &url, std::string &deep_link)
{
    std::string place_id;
    if (!parse_place_id(url, place_id))
        return false;

    deep_link = build(place_id);
    return true;
}
