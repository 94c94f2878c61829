#pragma once

#include <string>

#include "util/error.hpp"

extern "C" {
#include <sys/types.h>
#include <time.h>
}

std::string FormatTime(time_t t, const char *fmt = "%F %T");
std::string FormatExitStatus(int status);

pid_t GetPid();
uint64_t GetCurrentTimeMs();
void SetDieOnParentExit(int sig);
