#include "texts.hpp"

QString
helptexts::about()
{
    return tr("# Sober Launcher") + "\n\n"
        + tr("An easy launcher to control all your Sober instances.") + "\n\n"
        + tr("Each profile is a separate home folder, so every instance keeps its own login, settings and cache. "
             "The **Main Profile** is your regular Sober installation and cannot be removed.") + "\n\n"
        + tr("*Author: Taboulet*");
}

QString
helptexts::profiles_and_instances()
{
    return tr("# Profiles and instances") + "\n\n"
        + tr("## Launching") + "\n"
        + tr("- **Launch Game** starts every selected profile. A profile that is already running is left alone.") + "\n"
        + tr("- **Run with Console** does the same inside a terminal (konsole, x-terminal-emulator or gnome-terminal).") + "\n"
        + tr("- **Run Specific Game** asks for a game link such as ``https://www.roblox.com/games/123456/Name`` and opens that game.") + "\n\n"

        + tr("## Multi-instance") + "\n"
        + tr("- With multi-instance **off**, only one profile can be launched at a time, and nothing is launched while Sober is already running anywhere on the system.") + "\n"
        + tr("- With multi-instance **on**, any number of profiles can run together. Profiles launched in this session that are no longer running are listed at the bottom and painted blue; **Run Missing Instances** brings them back.") + "\n"
        + tr("- The running state is checked periodically, so it can lag behind for a moment after an instance closes.") + "\n\n"

        + tr("## Maintenance") + "\n"
        + tr("- **Fix** deletes the local files (``.ld.so``, ``.local`` and ``cache``) of the selected profiles. Game data is normally kept.") + "\n"
        + tr("- Right-click a profile to add it to your desktop or to remove it.") + "\n"
        + tr("- **Exit Sessions** force-closes every Sober instance, including the ones not started from here.");
}
