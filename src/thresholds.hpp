#pragma once

#include <string>
#include <vector>

#include "util/path.hpp"

/* Account id ranges from login.defs(5) */
struct TThresholds {
    int64_t RegularMin = 1000;
    int64_t RegularMax = 60000;
    int64_t SystemMin = 0;
    int64_t SystemMax = 999;

    /* Unknown keys are ignored, absent keys keep defaults */
    TError Parse(const std::vector<std::string> &lines);
    TError Load(const TPath &path);

    std::string ToString() const;
};
