#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

/*
 * Administrative privilege by sudoers(5) mention or by membership
 * in one of the privileged groups from group(5).
 */
class TPrivilegeResolver {
    std::vector<std::string> Grants;
    std::vector<std::string> Groups;
    std::vector<std::string> PrivilegedGroups;

public:
    TPrivilegeResolver() {}
    TPrivilegeResolver(const std::vector<std::string> &grants,
                       const std::vector<std::string> &groups,
                       const std::vector<std::string> &privileged = { "wheel", "admin", "sudo" }) :
        Grants(grants), Groups(groups), PrivilegedGroups(privileged) {}

    /* Any grant line containing "<name> " counts, field boundaries are not checked */
    bool IsGranted(const std::string &name) const;
    bool IsGroupMember(const std::string &name) const;

    bool IsPrivileged(const std::string &name) const {
        return IsGranted(name) || IsGroupMember(name);
    }
};
