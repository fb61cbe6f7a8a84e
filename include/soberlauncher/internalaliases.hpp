#pragma once
#include <set>
#include <string>
#include <vector>

// forward declarations
namespace soberlauncher {
    namespace management {
        constexpr bool __dummy__ = true;
    }
    namespace __util__ {
        constexpr bool __dummy__ = true;
    }
}

// aliases
namespace sl_mgmt = soberlauncher::management;
namespace sl_util = soberlauncher::__util__;

// define a dummy type inside a dummy namespace
namespace soberlauncher {
    namespace _internalaliases_dummy {
        struct anchor {};
        constexpr bool dummy = sl_mgmt::__dummy__;
        constexpr bool dummy_ = sl_util::__dummy__;
    }
}

// Type aliases
using profile_list = std::vector<std::string>;
using profile_set = std::set<std::string>;
