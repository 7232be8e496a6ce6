#include "qapp/platform.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace qapp {

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::optional<FileLock> FileLock::acquire(const std::string& path, std::string& error) {
    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !is_directory(parent)) {
        auto dir_result = atomic_create_directory(parent);
        if (!dir_result.ok) {
            error = "failed to create lock directory " + parent + ": " + dir_result.error;
            return std::nullopt;
        }
    }

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        error = "failed to open lock file " + path + ": " + std::string(strerror(errno));
        return std::nullopt;
    }

    while (flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        error = "failed to lock " + path + ": " + std::string(strerror(errno));
        close(fd);
        return std::nullopt;
    }

    return FileLock(fd, path);
}

void FileLock::release() {
    if (fd_ < 0) return;
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

} // namespace qapp
