#pragma once

#include "error.hpp"

extern "C" {
#include <sys/types.h>
}

struct TTask {
    pid_t Pid = 0;
    int Status = 0;
    bool Running = false;

    TError Fork();
    TError Wait();
    TError Kill(int signal) const;
};
