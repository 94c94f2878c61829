#pragma once

#include <string>
#include <cerrno>
#include <ostream>

#include "fmt/format.h"
#include "fmt/ostream.h"

#include "error.pb.h"

using ::lsa::EError;

/* Result of an operation: code, saved errno and what was being done */
class TError {
public:
    EError Error = EError::Success;
    int Errno = 0;
    std::string Text;

    TError() {}
    TError(EError err) : Error(err) {}
    TError(EError err, const std::string &text) : Error(err), Text(text) {}
    TError(EError err, int eno, const std::string &text) : Error(err), Errno(eno), Text(text) {}

    template <typename... Args> TError(EError err, const char *fmt, const Args&... args) :
        Error(err), Text(fmt::format(fmt::runtime(fmt), args...)) {}

    /* Keeps code and errno of cause, prepends context */
    template <typename... Args> TError(const TError &cause, const char *fmt, const Args&... args) :
        Error(cause.Error), Errno(cause.Errno),
        Text(fmt::format(fmt::runtime(fmt), args...) + ": " + cause.Text) {}

    explicit operator bool() const {
        return Error != EError::Success;
    }

    bool operator==(EError error) const {
        return Error == error;
    }

    static std::string ErrorName(EError error);

    /* Text and errno description, for the user */
    std::string Message() const;

    /* Code name and message, for logs */
    std::string ToString() const;

    /* Unknown with errno of failed syscall */
    template <typename... Args> static TError System(const char *fmt, const Args&... args) {
        int eno = errno;
        return TError(EError::Unknown, eno, fmt::format(fmt::runtime(fmt), args...));
    }

    friend std::ostream &operator<<(std::ostream &os, const TError &error) {
        return os << error.ToString();
    }
};

template <> struct fmt::formatter<TError> : fmt::ostream_formatter {};

extern const TError OK;
