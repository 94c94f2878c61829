#include "log.hpp"
#include "util/unix.hpp"

extern "C" {
#include <unistd.h>
#include <time.h>
}

bool Verbose = false;
bool Debug = false;

TFile LogFile;

void OpenLog() {
    LogFile.SetFd = STDERR_FILENO;
}

void WriteLog(const char *prefix, const std::string &log_msg) {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    std::string currentTimeMs = fmt::format("{}.{:03}", FormatTime(ts.tv_sec), ts.tv_nsec / 1000000);

    std::string msg = fmt::format("{} {}[{}]: {} {}\n",
            currentTimeMs, program_invocation_short_name, GetPid(), prefix, log_msg);

    if (!LogFile)
        return;

    /* nowhere to report a failed log write */
    (void)LogFile.WriteAll(msg);
}
