#include "task.hpp"
#include "unix.hpp"
#include "log.hpp"

extern "C" {
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
}

TError TTask::Kill(int signal) const {
    if (!Pid)
        return TError(EError::Unknown, "Task {} is not running", Pid);
    L_DBG("kill {} {}", signal, Pid);
    if (kill(Pid, signal))
        return TError::System("kill({})", Pid);
    return OK;
}

// after that fork use only syscalls and signal-safe functions
TError TTask::Fork() {
    pid_t ret = fork();
    if (ret < 0)
        return TError::System("fork");
    Pid = ret;
    Running = true;
    return OK;
}

TError TTask::Wait() {
    if (!Running)
        return TError(EError::Unknown, "Task {} is not running", Pid);

    pid_t ret;
    do
        ret = waitpid(Pid, &Status, 0);
    while (ret < 0 && errno == EINTR);

    if (ret < 0)
        return TError::System("waitpid({})", Pid);

    Running = false;

    if (Status)
        return TError(EError::HelperError, FormatExitStatus(Status));
    return OK;
}
