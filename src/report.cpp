#include "report.hpp"
#include "common.hpp"

TTuple ReportHeader(EReportDetail detail) {
    if (detail == EReportDetail::Full)
        return { "ID", "User", "Group ID", "GECOS", "Home", "Shell", "Sudo", "Last Login" };
    return { "ID", "User", "Home", "Shell", "Sudo", "Last Login" };
}

std::string TruncateComment(const std::string &comment) {
    std::string result = comment;

    if (StringLength(result) > COMMENT_MAX_LENGTH)
        result = StringPrefix(result, COMMENT_CUT_LENGTH) + "..";

    if (result.empty())
        result = COMMENT_EMPTY;

    return result;
}

TTuple ReportRow(const TAccount &account, const TSources &sources, EReportDetail detail) {
    std::string sudo = sources.Privileges.IsPrivileged(account.Name) ? "yes" : "no";
    std::string lastLogin = sources.History.LastLogin(account.Name);

    if (detail == EReportDetail::Full)
        return {
            std::to_string(account.Id),
            account.Name,
            std::to_string(account.GroupId),
            TruncateComment(account.Comment),
            account.Home,
            account.Shell,
            sudo,
            lastLogin,
        };

    return {
        std::to_string(account.Id),
        account.Name,
        account.Home,
        account.Shell,
        sudo,
        lastLogin,
    };
}

TReport BuildReport(const TSources &sources, EAccountScope scope, EReportDetail detail) {
    TReport report;

    report.Header = ReportHeader(detail);

    for (auto &account: ClassifyAccounts(sources.Accounts, sources.Thresholds, scope))
        report.Rows.push_back(ReportRow(account, sources, detail));

    return report;
}
