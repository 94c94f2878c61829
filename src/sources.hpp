#pragma once

#include <string>
#include <vector>

#include "account.hpp"
#include "thresholds.hpp"
#include "privilege.hpp"
#include "login_history.hpp"

struct TSourcePaths {
    TPath Passwd;
    TPath Group;
    TPath Sudoers;
    TPath Defs;
    TPath Wtmp;
    bool UsePasswdFile = false;

    static TSourcePaths FromConfig();
};

/* Everything the report needs, read once at startup */
struct TSources {
    TThresholds Thresholds;
    TPrivilegeResolver Privileges;
    TLoginHistory History;
    std::vector<TAccount> Accounts;

    /*
     * Fails if any of passwd, group, sudoers or login.defs cannot be read
     * or login.defs is malformed. Login history failure is not fatal.
     */
    TError Load(const TSourcePaths &paths,
                ILoginHistorySource &history,
                const std::vector<std::string> &privilegedGroups);
};
