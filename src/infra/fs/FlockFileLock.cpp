#include "infra/fs/FlockFileLock.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "common/Log.hpp"

namespace infra::fs {

FlockFileLock::~FlockFileLock() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : fds_) {
        ::flock(entry.second, LOCK_UN);
        ::close(entry.second);
    }
    fds_.clear();
}

bool FlockFileLock::tryAcquire(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = path.string();
    if (fds_.count(key) != 0U) {
        // flock is per open file description; a second open in this process
        // would succeed, so treat a re-acquire as contention.
        return false;
    }

    const int fd = ::open(key.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("FlockFileLock: unable to open " + key + ": " + std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int savedErrno = errno;
        ::close(fd);
        if (savedErrno != EWOULDBLOCK) {
            LOG_WARN("FlockFileLock: flock failed for " << key << ": " << std::strerror(savedErrno));
        }
        return false;
    }

    fds_.emplace(key, fd);
    return true;
}

void FlockFileLock::release(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = fds_.find(path.string());
    if (it == fds_.end()) {
        return;
    }
    const int fd = it->second;
    fds_.erase(it);
    ::flock(fd, LOCK_UN);
    ::close(fd);
}

}  // namespace infra::fs
