#include "account.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

extern "C" {
#include <pwd.h>
#include <unistd.h>
}

static size_t PwdBufSize = sysconf(_SC_GETPW_R_SIZE_MAX) > 0 ?
                           sysconf(_SC_GETPW_R_SIZE_MAX) : 16384;

TError TAccount::Parse(const std::string &line) {
    auto tokens = SplitString(line, ':', 7);
    TError error;

    /* getline drops empty tail */
    if (tokens.size() == 6 && StringEndsWith(line, ":"))
        tokens.push_back("");

    if (tokens.size() < 7)
        return TError(EError::InvalidValue, "invalid passwd line: {}", line);

    if (tokens[0].empty())
        return TError(EError::InvalidValue, "empty user name");

    error = StringToInt64(tokens[2], Id);
    if (error)
        return TError(error, "invalid uid for {}", tokens[0]);

    error = StringToInt64(tokens[3], GroupId);
    if (error)
        return TError(error, "invalid gid for {}", tokens[0]);

    Name = tokens[0];
    Comment = tokens[4];
    Home = tokens[5];
    Shell = tokens[6];

    return OK;
}

void ParsePasswd(const std::vector<std::string> &lines, std::vector<TAccount> &accounts) {
    for (auto &line: lines) {
        if (StringTrim(line).empty())
            continue;

        TAccount account;
        TError error = account.Parse(line);
        if (error) {
            L_VERBOSE("Skip passwd entry: {}", error);
            continue;
        }

        accounts.push_back(account);
    }
}

TError ListAccounts(std::vector<TAccount> &accounts) {
    struct passwd pwd, *ptr;
    std::vector<char> buf(PwdBufSize, '\0');
    TError error;
    int err;

    setpwent();

    while (true) {
        err = getpwent_r(&pwd, buf.data(), buf.size(), &ptr);
        if (err == ERANGE) {
            PwdBufSize *= 2;
            buf.resize(PwdBufSize);
            L_DBG("Increase user buffer to {}", PwdBufSize);
            continue;
        }
        if (err || !ptr)
            break;

        TAccount account;
        account.Id = pwd.pw_uid;
        account.Name = pwd.pw_name;
        account.GroupId = pwd.pw_gid;
        account.Comment = pwd.pw_gecos ? pwd.pw_gecos : "";
        account.Home = pwd.pw_dir ? pwd.pw_dir : "";
        account.Shell = pwd.pw_shell ? pwd.pw_shell : "";

        if (account.Name.empty())
            continue;

        accounts.push_back(account);
    }

    /* ENOENT marks end of database */
    if (err && err != ENOENT)
        error = TError(EError::Unknown, err, "Cannot list users");

    endpwent();

    return error;
}
