#pragma once

#include <string>

#include "classifier.hpp"
#include "report.hpp"

constexpr int EXIT_USAGE = 2;

struct TOptions {
    bool ShowHelp = false;
    bool ShowVersion = false;
    bool ShowSystem = false;
    bool ShowUsers = false;
    bool ShowAll = false;
    bool ShowFull = false;
    bool Verbose = false;
    int UseColor = -1;  /* -1 - from config */
    std::string ConfigPath;

    /* -s over -u over -a, without any of them regular scope is implicit */
    EAccountScope Scope(bool &implicit) const;

    EReportDetail Detail() const {
        return ShowFull ? EReportDetail::Full : EReportDetail::Standard;
    }
};

/* Bad usage is InvalidValue, getopt state is reset on every call */
TError ParseOptions(int argc, char *argv[], TOptions &options);

/* Exit status: 0 - report shown, 1 - sources failed, 2 - bad usage */
int RunCli(int argc, char *argv[]);
