#include "soberlauncher/profiledata.hpp"
#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/debug.hpp"
#include "soberlauncher/util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

bool
sl_mgmt::profiles::validate_name(const std::string &name, std::string &error)
{
    std::string trimmed = sl_util::trim_string(name);

    if (trimmed.empty()) {
        error = "Enter a valid profile name.";
        return false;
    }
    if (is_main_profile(trimmed)) {
        error = "'" + main_profile + "' already exists.";
        return false;
    }
    if (trimmed == "." || trimmed == ".." || trimmed.find('/') != std::string::npos) {
        error = "Profile names can't contain '/' or be '.' or '..'.";
        return false;
    }
    return true;
}

bool
sl_mgmt::profiles::create_profile(const std::string &root, const std::string &name, std::string &error)
{
    if (!validate_name(name, error))
        return false;

    fs::path marker = fs::path(profile_path(root, sl_util::trim_string(name))) / profile_marker;

    std::error_code ec;
    fs::create_directories(marker, ec);
    if (ec) {
        error = "Failed to create profile directory: " + ec.message();
        return false;
    }

    DEBUG_LOG("[profiles] created ", marker.string());
    return true;
}

bool
sl_mgmt::profiles::remove_profile(const std::string &root, const std::string &name, std::string &error)
{
    if (is_main_profile(name)) {
        error = "Cannot remove '" + main_profile + "'.";
        return false;
    }
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        error = "Invalid profile name: " + name;
        return false;
    }

    std::string path = profile_path(root, name);
    if (!sl_util::is_directory(path)) {
        error = "Profile directory not found.";
        return false;
    }

    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        error = "Failed to remove '" + name + "': " + ec.message();
        return false;
    }

    DEBUG_LOG("[profiles] removed ", path);
    return true;
}

std::string
sl_mgmt::profiles::app_data_dir(const std::string &root,
                                const std::string &name,
                                const std::string &identity)
{
    fs::path home = is_main_profile(name) ? fs::path(sl_util::home_directory())
                                          : fs::path(profile_path(root, name));
    return (home / ".var" / "app" / identity).string();
}

bool
sl_mgmt::profiles::fix_profile(const std::string &root,
                               const std::string &name,
                               const std::string &identity,
                               std::vector<std::string> &errors)
{
    size_t errors_before = errors.size();
    fs::path app_dir = app_data_dir(root, name, identity);

    for (const char *entry : {".ld.so", ".local", "cache"}) {
        fs::path target = app_dir / entry;

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(target, ec)))
            continue;

        // remove_all doesn't follow symlinks, it drops the link itself
        fs::remove_all(target, ec);
        if (ec) {
            errors.push_back(name + ": failed to delete " + entry + ": " + ec.message());
            continue;
        }
        DEBUG_LOG("[profiles] fix ", name, ": deleted ", target.string());
    }

    return errors.size() == errors_before;
}

bool
sl_mgmt::profiles::copy_main_profile_data(const std::string &src_app_dir,
                                          const std::string &dst_profile,
                                          std::string &error)
{
    std::error_code ec;
    if (!fs::is_directory(src_app_dir, ec)) {
        error = "Main profile data not found: " + src_app_dir;
        return false;
    }

    // <dst_profile>/.var/app/<identity>
    fs::path src(src_app_dir);
    fs::path dst_app_parent = fs::path(dst_profile) / ".var" / "app";
    fs::path dst = dst_app_parent / src.filename();

    fs::create_directories(dst, ec);
    if (ec) {
        error = "Failed to create " + dst.string() + ": " + ec.message();
        return false;
    }

    DEBUG_LOG("[profiles] copying ", src.string(), " -> ", dst.string());
    fs::copy(src, dst,
             fs::copy_options::recursive |
             fs::copy_options::overwrite_existing |
             fs::copy_options::copy_symlinks,
             ec);
    if (ec) {
        error = ec.message();
        return false;
    }

    // The session lives in appData; the new profile has to log in by itself
    fs::path appdata = dst / "data" / "sober" / "appData";
    if (fs::exists(appdata, ec)) {
        fs::remove_all(appdata, ec);
        if (ec) {
            std::cerr << "Warning: could not drop copied appData: " << ec.message() << std::endl;
        }
    }

    return true;
}

std::string
sl_mgmt::profiles::desktop_entry_dir()
{
    fs::path home = sl_util::home_directory();
    fs::path desktop = home / "Desktop";
    return sl_util::is_directory(desktop.string()) ? desktop.string() : home.string();
}

bool
sl_mgmt::profiles::write_desktop_entry(const std::string &profile,
                                       const std::string &target_dir,
                                       const std::string &exec_line,
                                       const std::string &icon_path,
                                       std::string &written_path,
                                       std::string &error)
{
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        error = "Failed to create " + target_dir + ": " + ec.message();
        return false;
    }

    fs::path filename = fs::path(target_dir) / (profile + ".desktop");

    std::ofstream out(filename, std::ios::trunc);
    if (!out.is_open()) {
        error = "Failed to create " + filename.string();
        return false;
    }

    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Name=" << profile << "\n"
        << "Exec=" << exec_line << "\n"
        << "Icon=" << icon_path << "\n"
        << "Terminal=false\n";
    out.close();

    if (!out) {
        error = "Failed to write " + filename.string();
        return false;
    }

    // rwxr-xr-x, desktops refuse to run non-executable entries
    fs::permissions(filename,
                    fs::perms::owner_all |
                    fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    if (ec) {
        error = "Created " + filename.string() + " but could not make it executable: " + ec.message();
        return false;
    }

    written_path = filename.string();
    return true;
}
