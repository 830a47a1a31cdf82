#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace runbox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const filesystem::path &path, const string &content) {
    // 使用 POSIX 接口而不是 ofstream，这样可以拿到 errno（比如 ENOSPC、EACCES）
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to create file " + path.string());

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            throw system_error(err, system_category(), "unable to write file " + path.string());
        }
        written += (size_t)n;
    }

    if (close(fd) != 0)
        throw system_error(errno, system_category(), "unable to close file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath == "." || subpath == ".." ||
        subpath.find('/') != string::npos || subpath.find('\0') != string::npos)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace runbox
