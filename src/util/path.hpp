#pragma once

#include <string>
#include <vector>
#include <ostream>

#include "util/error.hpp"

/* Whole-file reads of databases and configs stop here */
constexpr size_t FILE_READ_LIMIT = 16 << 20;

class TPath {
    std::string Path;

    friend class TFile;

public:
    TPath() {}
    TPath(const std::string &path) : Path(path) {}
    TPath(const char *path) : Path(path) {}

    const char *c_str() const noexcept {
        return Path.c_str();
    }

    std::string ToString() const {
        return Path;
    }

    /* dir / name with exactly one separator */
    friend TPath operator/(const TPath &dir, const TPath &name);

    friend std::ostream &operator<<(std::ostream &os, const TPath &path) {
        return os << path.Path;
    }

    /* Missing file is not an error */
    TError Unlink() const;

    /* Entry names without hidden ones, in directory order */
    TError ReadDirectory(std::vector<std::string> &names) const;

    TError ReadAll(std::string &text, size_t max = FILE_READ_LIMIT) const;

    /* Lines without '\n', no empty tail after final newline */
    TError ReadLines(std::vector<std::string> &lines, size_t max = FILE_READ_LIMIT) const;
};

TPath operator/(const TPath &dir, const TPath &name);

template <> struct fmt::formatter<TPath> : fmt::ostream_formatter {};

/* Owned file descriptor, closed at destruction */
class TFile {
    TFile(const TFile &) = delete;
    TFile &operator=(const TFile &) = delete;

public:
    union {
        const int Fd;
        int SetFd;
    };

    TFile() : Fd(-1) {}
    ~TFile() {
        Close();
    }

    explicit operator bool() const {
        return Fd >= 0;
    }

    TError OpenRead(const TPath &path);

    /* Replaces trailing XXXXXX in temp with unique suffix */
    TError CreateTemporary(TPath &temp);

    static TError Pipe(TFile &read, TFile &write);

    void Close();

    /* Reads until EOF, works for pipes and procfs */
    TError ReadAll(std::string &text, size_t max) const;
    TError WriteAll(const std::string &text) const;
};
