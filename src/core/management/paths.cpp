#include "soberlauncher/paths.hpp"
#include "soberlauncher/debug.hpp"
#include "soberlauncher/util.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

std::string
sl_mgmt::resolve_data_root()
{
    const char *flatpak_id = std::getenv("FLATPAK_ID");
    const char *xdg_data_home = std::getenv("XDG_DATA_HOME");
    std::string home = sl_util::home_directory();

    fs::path base;
    if (flatpak_id && *flatpak_id) {
        if (xdg_data_home && *xdg_data_home)
            base = xdg_data_home;
        else
            base = fs::path(home) / ".var" / "app" / flatpak_id / "data";
    } else {
        base = fs::path(home) / ".var" / "app" / launcher_app_id / "data";
    }

    // normalise and drop any trailing slash
    std::string data_root = (base / "SoberLauncher").lexically_normal().string();
    while (data_root.size() > 1 && data_root.back() == '/')
        data_root.pop_back();

    std::error_code ec;
    fs::create_directories(data_root, ec);
    if (ec) {
        std::cerr << "Warning: cannot create data directory " << data_root
                  << ": " << ec.message() << std::endl;
    }

    DEBUG_LOG("[paths] data root: ", data_root);
    return data_root;
}

std::string
sl_mgmt::settings_path(const std::string &data_root)
{
    return (fs::path(data_root) / "SL_Settings.json").string();
}
