#include <string>

#include "util/string.hpp"
#include "unix.hpp"

extern "C" {
#include <unistd.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
}

pid_t GetPid() {
    return syscall(SYS_getpid);
}

uint64_t GetCurrentTimeMs() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (int64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

void SetDieOnParentExit(int sig) {
    (void)prctl(PR_SET_PDEATHSIG, sig, 0, 0, 0);
}

std::string FormatExitStatus(int status) {
    if (WIFSIGNALED(status))
        return fmt::format("exit signal: {} ({}){}", WTERMSIG(status),
                           strsignal(WTERMSIG(status)),
                           WCOREDUMP(status) ? " (Core dumped)": "");
    return fmt::format("exit code: {}", WEXITSTATUS(status));
}

std::string FormatTime(time_t t, const char *fmt) {
    struct tm tm;
    char buf[256];

    localtime_r(&t, &tm);
    strftime(buf, sizeof(buf), fmt, &tm);

    return std::string(buf);
}
