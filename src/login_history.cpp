#include <sstream>

#include "login_history.hpp"
#include "helpers.hpp"
#include "common.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

constexpr size_t LOGIN_RECORD_FIELDS = 7;

TError TLastCommand::Query(const TPath &log, std::vector<std::string> &lines) {
    std::vector<std::string> command = Command;
    std::string output, line;
    TError error;

    command.push_back(log.ToString());

    error = RunCommand(command, output, TimeoutMs, MaxOutput);
    if (error)
        return error;

    if (!StringIsUtf8(output))
        return TError(EError::InvalidData, "Output of {} is not valid text", Command[0]);

    std::stringstream ss(output);
    while (std::getline(ss, line))
        lines.push_back(line);

    return OK;
}

void TLoginHistory::Parse(const std::vector<std::string> &lines) {
    for (auto &line: lines) {
        auto fields = SplitWords(line);
        if (fields.size() < LOGIN_RECORD_FIELDS)
            continue;

        TLoginRecord record;
        record.Name = fields[0];
        record.When = fields[3] + " " + fields[4] + " " + fields[5] + " " + fields[6];
        Records.push_back(record);
    }
}

void TLoginHistory::Load(ILoginHistorySource &source, const TPath &log) {
    std::vector<std::string> lines;
    TError error;

    Records.clear();

    error = source.Query(log, lines);
    if (error) {
        L_WRN("Login history unavailable, last logins are not shown: {}", error);
        return;
    }

    Parse(lines);

    L_VERBOSE("Login history {}: {} records", log, Records.size());
}

std::string TLoginHistory::LastLogin(const std::string &name) const {
    for (auto &record: Records)
        if (record.Name == name)
            return record.When;

    return LAST_LOGIN_NOT_FOUND;
}
