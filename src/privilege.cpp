#include <algorithm>

#include "privilege.hpp"
#include "util/string.hpp"

bool TPrivilegeResolver::IsGranted(const std::string &name) const {
    std::string pattern = name + " ";

    for (auto &line: Grants)
        if (line.find(pattern) != std::string::npos)
            return true;

    return false;
}

bool TPrivilegeResolver::IsGroupMember(const std::string &name) const {
    for (auto &line: Groups) {
        /* name:password:gid:members */
        auto fields = SplitString(StringTrim(line, " \t\r\n"), ':');
        if (fields.size() < 4)
            continue;

        if (std::find(PrivilegedGroups.begin(), PrivilegedGroups.end(),
                      fields[0]) == PrivilegedGroups.end())
            continue;

        for (auto &member: SplitString(fields[3], ','))
            if (member == name)
                return true;
    }

    return false;
}
