#include "soberlauncher/reconciliation.hpp"
#include "soberlauncher/debug.hpp"

#include <algorithm>

bool
sl_mgmt::reconciliation_tracker::record_launch(const std::string &profile)
{
    if (contains(profile))
        return false;

    launched_.push_back(profile);
    return true;
}

bool
sl_mgmt::reconciliation_tracker::record_removal(const std::string &profile)
{
    auto it = std::find(launched_.begin(), launched_.end(), profile);
    if (it == launched_.end())
        return false;

    launched_.erase(it);
    return true;
}

void
sl_mgmt::reconciliation_tracker::clear()
{
    launched_.clear();
}

bool
sl_mgmt::reconciliation_tracker::contains(const std::string &profile) const
{
    return std::find(launched_.begin(), launched_.end(), profile) != launched_.end();
}

profile_list
sl_mgmt::reconciliation_tracker::missing(const profile_set &live) const
{
    profile_list result;
    for (const auto &profile : launched_) {
        if (live.find(profile) == live.end())
            result.push_back(profile);
    }
    return result;
}
