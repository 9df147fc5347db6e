#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

#include "domain/Ports.hpp"

namespace infra::fs {

// flock(2)-based advisory lock. Only coordinates processes on one host; the
// lock is dropped by the kernel if the holder dies.
class FlockFileLock : public domain::IFileLock {
public:
    FlockFileLock() = default;
    ~FlockFileLock() override;

    FlockFileLock(const FlockFileLock&) = delete;
    FlockFileLock& operator=(const FlockFileLock&) = delete;

    bool tryAcquire(const std::filesystem::path& path) override;
    void release(const std::filesystem::path& path) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, int> fds_;
};

}  // namespace infra::fs
