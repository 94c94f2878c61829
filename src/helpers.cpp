#include "helpers.hpp"
#include "util/log.hpp"
#include "util/task.hpp"
#include "util/unix.hpp"
#include "util/string.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>

extern "C" {
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <signal.h>
}

constexpr size_t HELPER_STDERR_LIMIT = 64 << 10;

static void HelperExec(const std::vector<std::string> &command,
                       const TFile &out, const TFile &err) __attribute__ ((noreturn));

static void HelperExec(const std::vector<std::string> &command,
                       const TFile &out, const TFile &err) {
    SetDieOnParentExit(SIGKILL);

    int null = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null < 0 || dup2(null, STDIN_FILENO) != STDIN_FILENO)
        _exit(EXIT_FAILURE);

    if (dup2(out.Fd, STDOUT_FILENO) != STDOUT_FILENO)
        _exit(EXIT_FAILURE);

    if (dup2(err.Fd, STDERR_FILENO) != STDERR_FILENO)
        _exit(EXIT_FAILURE);

    std::vector<const char *> argv;
    for (auto &arg: command)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    execvp(argv[0], (char **)argv.data());

    std::string msg = fmt::format("Cannot execute {}: {}", argv[0], strerror(errno));
    (void)write(STDERR_FILENO, msg.c_str(), msg.size());
    _exit(EXIT_FAILURE);
}

TError RunCommand(const std::vector<std::string> &command,
                  std::string &output, uint64_t timeout_ms, size_t max_output) {
    TFile out_read, out_write, err_read, err_write;
    std::string errText;
    TError error;
    TTask task;

    if (!command.size())
        return TError(EError::InvalidValue, "External command is empty");

    std::string cmdline;

    for (auto &arg : command)
        cmdline += arg + " ";

    error = TFile::Pipe(out_read, out_write);
    if (error)
        return error;

    error = TFile::Pipe(err_read, err_write);
    if (error)
        return error;

    L_VERBOSE("Call helper: {}", cmdline);

    error = task.Fork();
    if (error)
        return error;

    if (!task.Pid)
        HelperExec(command, out_write, err_write);

    out_write.Close();
    err_write.Close();

    output.clear();

    /* too far to reach is the same as no limit */
    uint64_t start = GetCurrentTimeMs();
    uint64_t deadline = 0;
    if (timeout_ms && timeout_ms < UINT64_MAX - start)
        deadline = start + timeout_ms;
    struct pollfd fds[2] = {
        { out_read.Fd, POLLIN, 0 },
        { err_read.Fd, POLLIN, 0 },
    };
    std::string *sinks[2] = { &output, &errText };
    char buf[16384];

    while (!error && (fds[0].fd >= 0 || fds[1].fd >= 0)) {
        int timeout = -1;

        if (deadline) {
            uint64_t now = GetCurrentTimeMs();
            if (now >= deadline) {
                error = TError(EError::Timeout, "helper: {} timeout {} ms", cmdline, timeout_ms);
                break;
            }
            timeout = (int)std::min(deadline - now, (uint64_t)INT_MAX);
        }

        int ret = poll(fds, 2, timeout);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            error = TError::System("poll");
            break;
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || !fds[i].revents)
                continue;

            ssize_t len = read(fds[i].fd, buf, sizeof(buf));
            if (len < 0 && errno == EINTR)
                continue;
            if (len < 0) {
                error = TError::System("read");
                break;
            }
            if (len == 0) {
                fds[i].fd = -1;
                continue;
            }

            if (i == 0 && output.size() + len > max_output) {
                error = TError(EError::InvalidData, "helper: {} output is over {} bytes", cmdline, max_output);
                break;
            }

            if (i == 0 || errText.size() < HELPER_STDERR_LIMIT)
                sinks[i]->append(buf, len);
        }
    }

    if (error) {
        TError error2 = task.Kill(SIGKILL);
        if (error2)
            L_WRN("Cannot kill helper: {}", error2);
        error2 = task.Wait();
        if (error2)
            L_DBG("Killed helper: {}", error2);
        return error;
    }

    error = task.Wait();
    if (error)
        return TError(error, "helper: {} stderr: {}", cmdline, StringTrim(errText));

    return OK;
}
