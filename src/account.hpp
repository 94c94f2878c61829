#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

struct TAccount {
    int64_t Id = 0;
    std::string Name;
    int64_t GroupId = 0;
    std::string Comment;
    std::string Home;
    std::string Shell;

    /* name:password:uid:gid:gecos:home:shell */
    TError Parse(const std::string &line);
};

/* All accounts known to name service, in database order */
TError ListAccounts(std::vector<TAccount> &accounts);

/* Accounts from passwd(5) lines, malformed lines are skipped */
void ParsePasswd(const std::vector<std::string> &lines, std::vector<TAccount> &accounts);
