#include "sources.hpp"
#include "config.hpp"
#include "util/log.hpp"

TSourcePaths TSourcePaths::FromConfig() {
    TSourcePaths paths;
    auto &sources = config().sources();

    paths.Passwd = sources.passwd_file();
    paths.Group = sources.group_file();
    paths.Sudoers = sources.sudoers_file();
    paths.Defs = sources.defs_file();
    paths.Wtmp = sources.wtmp_file();
    paths.UsePasswdFile = sources.use_passwd_file();

    return paths;
}

TError TSources::Load(const TSourcePaths &paths,
                      ILoginHistorySource &history,
                      const std::vector<std::string> &privilegedGroups) {
    std::vector<std::string> passwd, groups, grants;
    TError error;

    error = paths.Passwd.ReadLines(passwd);
    if (error)
        return error;

    error = paths.Group.ReadLines(groups);
    if (error)
        return error;

    error = Thresholds.Load(paths.Defs);
    if (error)
        return error;

    error = paths.Sudoers.ReadLines(grants);
    if (error)
        return error;

    Privileges = TPrivilegeResolver(grants, groups, privilegedGroups);

    Accounts.clear();
    if (paths.UsePasswdFile) {
        ParsePasswd(passwd, Accounts);
    } else {
        error = ListAccounts(Accounts);
        if (error)
            return error;
    }

    L_VERBOSE("Loaded {} accounts", Accounts.size());

    History.Load(history, paths.Wtmp);

    return OK;
}
