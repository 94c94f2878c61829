#pragma once

#include <string>
#include <vector>

#include "classifier.hpp"
#include "sources.hpp"
#include "util/string.hpp"

enum class EReportDetail {
    Standard,   /* id user home shell sudo last_login */
    Full,       /* id user gid gecos home shell sudo last_login */
};

struct TReport {
    TTuple Header;
    std::vector<TTuple> Rows;
};

TTuple ReportHeader(EReportDetail detail);

/* Longer than 18 characters is cut to 16 plus "..", empty becomes "None" */
std::string TruncateComment(const std::string &comment);

TTuple ReportRow(const TAccount &account, const TSources &sources, EReportDetail detail);

TReport BuildReport(const TSources &sources, EAccountScope scope, EReportDetail detail);
