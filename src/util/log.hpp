#pragma once

#include <string>
#include "util/path.hpp"
#include "fmt/format.h"

extern bool Verbose;
extern bool Debug;
extern TFile LogFile;

void OpenLog();
void WriteLog(const char *prefix, const std::string &log_msg);

template <typename... Args> inline void L_DBG(const char* fmt, const Args&... args) {
    if (Debug)
        WriteLog("DBG", fmt::format(fmt::runtime(fmt), args...));
}

template <typename... Args> inline void L_VERBOSE(const char* fmt, const Args&... args) {
    if (Verbose)
        WriteLog("   ", fmt::format(fmt::runtime(fmt), args...));
}

template <typename... Args> inline void L_WRN(const char* fmt, const Args&... args) {
    WriteLog("WRN", fmt::format(fmt::runtime(fmt), args...));
}

