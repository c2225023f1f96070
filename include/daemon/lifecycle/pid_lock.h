#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace zonelink::lifecycle {

/**
 * @brief Exclusive flock() on a PID file; one zonelinkd per host and endpoint.
 *
 * The file holds the owner's PID and is removed when the lock is released.
 */
class PidLock {
   public:
    static std::optional<PidLock> tryAcquire(const std::string& path);

    // PID written by the current holder, 0 if unreadable.
    static pid_t readOwner(const std::string& path);

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;

    ~PidLock();

    const std::string& path() const {
        return path_;
    }

   private:
    PidLock(std::string path, int fd);

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
};

}  // namespace zonelink::lifecycle
