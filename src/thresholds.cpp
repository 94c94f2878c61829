#include "thresholds.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

TError TThresholds::Parse(const std::vector<std::string> &lines) {
    const std::vector<std::pair<std::string, int64_t *>> keys = {
        { "UID_MIN", &RegularMin },
        { "UID_MAX", &RegularMax },
        { "SYS_UID_MIN", &SystemMin },
        { "SYS_UID_MAX", &SystemMax },
    };
    TError error;

    for (auto &line: lines) {
        auto fields = SplitWords(line);
        if (fields.empty())
            continue;

        for (auto &key: keys) {
            if (fields[0] != key.first)
                continue;

            if (fields.size() < 2)
                return TError(EError::InvalidValue, "{} has no value", key.first);

            error = StringToInt64(fields[1], *key.second);
            if (error)
                return TError(error, "{}", key.first);
            break;
        }
    }

    return OK;
}

TError TThresholds::Load(const TPath &path) {
    std::vector<std::string> lines;
    TError error;

    error = path.ReadLines(lines);
    if (error)
        return error;

    error = Parse(lines);
    if (error)
        return TError(error, "Invalid value in {}", path);

    L_VERBOSE("Thresholds from {}: {}", path, ToString());

    return OK;
}

std::string TThresholds::ToString() const {
    return fmt::format("regular {}-{} system {}-{}",
                       RegularMin, RegularMax, SystemMin, SystemMax);
}
