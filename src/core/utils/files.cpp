#include "soberlauncher/util.hpp"

#include <cstdlib>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

bool
sl_util::is_directory (const std::string& path)
{
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0)
        return false;
    return S_ISDIR(buffer.st_mode);
}

std::string
sl_util::home_directory()
{
    const char *home = std::getenv("HOME");
    if (home && *home)
        return home;

    // No $HOME (e.g. started from a stripped environment): ask passwd
    struct passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir)
        return pw->pw_dir;

    return "/";
}
