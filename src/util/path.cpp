#include "util/path.hpp"

extern "C" {
#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
}

TPath operator/(const TPath &dir, const TPath &name) {
    if (dir.Path.empty())
        return name;

    std::string path = dir.Path;
    if (path.back() != '/')
        path += '/';

    size_t start = name.Path.find_first_not_of('/');
    if (start != std::string::npos)
        path += name.Path.substr(start);

    return TPath(path);
}

TError TPath::Unlink() const {
    if (unlink(Path.c_str()) && errno != ENOENT)
        return TError::System("Cannot remove {}", Path);
    return OK;
}

TError TPath::ReadDirectory(std::vector<std::string> &names) const {
    DIR *dir = opendir(Path.c_str());
    if (!dir)
        return TError::System("Cannot open directory {}", Path);

    names.clear();
    while (struct dirent *de = readdir(dir)) {
        if (de->d_name[0] != '.')
            names.push_back(de->d_name);
    }

    closedir(dir);
    return OK;
}

TError TPath::ReadAll(std::string &text, size_t max) const {
    TFile file;
    TError error;

    error = file.OpenRead(*this);
    if (error)
        return error;

    error = file.ReadAll(text, max);
    if (error)
        return TError(error, "Cannot read {}", Path);

    return OK;
}

TError TPath::ReadLines(std::vector<std::string> &lines, size_t max) const {
    std::string text;
    TError error;

    error = ReadAll(text, max);
    if (error)
        return error;

    for (size_t pos = 0; pos < text.size(); ) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos)
            end = text.size();
        lines.push_back(text.substr(pos, end - pos));
        pos = end + 1;
    }

    return OK;
}

TError TFile::OpenRead(const TPath &path) {
    Close();
    SetFd = open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOCTTY);
    if (Fd < 0)
        return TError::System("Unable to open {}", path);
    return OK;
}

TError TFile::CreateTemporary(TPath &temp) {
    Close();
    SetFd = mkostemp(&temp.Path[0], O_CLOEXEC);
    if (Fd < 0)
        return TError::System("Cannot create temporary file {}", temp);
    return OK;
}

TError TFile::Pipe(TFile &read, TFile &write) {
    int fds[2];

    if (pipe2(fds, O_CLOEXEC))
        return TError::System("pipe2");

    read.Close();
    read.SetFd = fds[0];
    write.Close();
    write.SetFd = fds[1];

    return OK;
}

void TFile::Close() {
    if (Fd >= 0)
        close(Fd);
    SetFd = -1;
}

TError TFile::ReadAll(std::string &text, size_t max) const {
    char buf[16384];

    text.clear();

    while (true) {
        ssize_t len = read(Fd, buf, sizeof(buf));
        if (len < 0 && errno == EINTR)
            continue;
        if (len < 0)
            return TError::System("read");
        if (len == 0)
            break;
        if (text.size() + len > max)
            return TError(EError::InvalidData, "Data is over {} bytes", max);
        text.append(buf, len);
    }

    return OK;
}

TError TFile::WriteAll(const std::string &text) const {
    size_t off = 0;

    while (off < text.size()) {
        ssize_t len = write(Fd, text.data() + off, text.size() - off);
        if (len < 0 && errno == EINTR)
            continue;
        if (len < 0)
            return TError::System("write");
        off += len;
    }

    return OK;
}
