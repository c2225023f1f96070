#include "daemon/lifecycle/pid_lock.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace zonelink::lifecycle {

pid_t PidLock::readOwner(const std::string& path) {
    std::ifstream pidfile(path);
    if (!pidfile.is_open()) {
        return 0;
    }
    pid_t pid = 0;
    pidfile >> pid;
    return pidfile.fail() ? 0 : pid;
}

std::optional<PidLock> PidLock::tryAcquire(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("PID lock: cannot open {}: {}", path, std::strerror(errno));
        return std::nullopt;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        if (errno == EWOULDBLOCK) {
            pid_t owner = readOwner(path);
            if (owner > 0) {
                LOG_ERROR("zonelinkd is already running (PID {}, lock {})", owner, path);
            } else {
                LOG_ERROR("zonelinkd is already running (lock {})", path);
            }
        } else {
            LOG_ERROR("PID lock: cannot lock {}: {}", path, std::strerror(errno));
        }
        ::close(fd);
        return std::nullopt;
    }

    if (::ftruncate(fd, 0) < 0) {
        LOG_WARN("PID lock: cannot truncate {}", path);
    }
    ::dprintf(fd, "%d\n", ::getpid());
    ::fsync(fd);

    return PidLock(path, fd);
}

PidLock::PidLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

PidLock::PidLock(PidLock&& other) noexcept : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

PidLock::~PidLock() {
    release();
}

void PidLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    if (!path_.empty()) {
        ::unlink(path_.c_str());
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace zonelink::lifecycle
