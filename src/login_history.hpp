#pragma once

#include <string>
#include <vector>

#include "util/path.hpp"

class ILoginHistorySource {
public:
    virtual ~ILoginHistorySource() {}
    virtual TError Query(const TPath &log, std::vector<std::string> &lines) = 0;
};

/* Runs last(1) against wtmp file */
class TLastCommand : public ILoginHistorySource {
    std::vector<std::string> Command;
    uint64_t TimeoutMs;
    size_t MaxOutput;

public:
    TLastCommand(const std::vector<std::string> &command,
                 uint64_t timeout_ms, size_t max_output) :
        Command(command), TimeoutMs(timeout_ms), MaxOutput(max_output) {}

    TError Query(const TPath &log, std::vector<std::string> &lines) override;
};

struct TLoginRecord {
    std::string Name;
    std::string When;
};

class TLoginHistory {
    std::vector<TLoginRecord> Records;

public:
    /* user tty host weekday month day time ... */
    void Parse(const std::vector<std::string> &lines);

    /* Failed query leaves history empty */
    void Load(ILoginHistorySource &source, const TPath &log);

    /* First matching record, history is expected newest first */
    std::string LastLogin(const std::string &name) const;

    size_t Size() const {
        return Records.size();
    }
};
