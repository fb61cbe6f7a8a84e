#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/debug.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// One run of a name: either all digits or no digits at all
struct name_run
{
    bool digits;
    std::string text;
};

// "Profile 10b" -> ["profile ", "10", "b"]
// Non-digit runs are lowercased here so the comparison doesn't have to.
// The first run is always a (possibly empty) non-digit run, so runs of the
// same index always have the same kind in two names.
std::vector<name_run>
split_runs(const std::string &name)
{
    std::vector<name_run> runs;
    runs.push_back({false, ""});

    for (char c : name) {
        bool is_digit = std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (is_digit != runs.back().digits)
            runs.push_back({is_digit, ""});
        runs.back().text += is_digit ? c : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return runs;
}

// Numeric comparison of two digit strings of any length
int
compare_digit_runs(const std::string &a, const std::string &b)
{
    size_t za = a.find_first_not_of('0');
    size_t zb = b.find_first_not_of('0');
    std::string na = (za == std::string::npos) ? "" : a.substr(za);
    std::string nb = (zb == std::string::npos) ? "" : b.substr(zb);

    if (na.size() != nb.size())
        return na.size() < nb.size() ? -1 : 1;
    return na.compare(nb);
}

} // namespace

bool
sl_mgmt::profiles::is_main_profile(const std::string &name)
{
    return name == main_profile;
}

bool
sl_mgmt::profiles::natural_less(const std::string &a, const std::string &b)
{
    std::vector<name_run> ra = split_runs(a);
    std::vector<name_run> rb = split_runs(b);

    size_t common = std::min(ra.size(), rb.size());
    for (size_t i = 0; i < common; ++i) {
        int cmp = ra[i].digits ? compare_digit_runs(ra[i].text, rb[i].text)
                               : ra[i].text.compare(rb[i].text);
        if (cmp != 0)
            return cmp < 0;
    }

    if (ra.size() != rb.size())
        return ra.size() < rb.size();

    // Equal keys ("a01" vs "a1", "abc" vs "ABC"): fall back to the raw bytes
    // so the order doesn't depend on directory iteration order.
    return a < b;
}

profile_list
sl_mgmt::profiles::order(profile_list names)
{
    names.erase(std::remove(names.begin(), names.end(), main_profile), names.end());

    std::sort(names.begin(), names.end(), natural_less);
    names.erase(std::unique(names.begin(), names.end()), names.end());

    names.insert(names.begin(), main_profile);
    return names;
}

profile_list
sl_mgmt::profiles::scan(const std::string &root)
{
    profile_list found;

    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        DEBUG_LOG("[profiles] data root missing: ", root);
        return found;
    }

    fs::directory_iterator it(root, ec);
    if (ec) {
        DEBUG_LOG("[profiles] cannot list ", root, ": ", ec.message());
        return found;
    }

    for (const auto &entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec))
            continue;
        if (!fs::is_directory(entry.path() / profile_marker, entry_ec))
            continue;

        found.push_back(entry.path().filename().string());
    }

    DEBUG_LOG("[profiles] scanned ", root, ": ", found);
    return found;
}

profile_list
sl_mgmt::profiles::list(const std::string &root)
{
    return order(scan(root));
}

std::string
sl_mgmt::profiles::profile_path(const std::string &root, const std::string &name)
{
    return (fs::path(root) / name).string();
}

std::string
sl_mgmt::profiles::home_for(const std::string &root, const std::string &name)
{
    if (is_main_profile(name))
        return "";
    return profile_path(root, name);
}
