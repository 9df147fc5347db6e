#include <filesystem>
#include <iostream>

#include "TestSupport.hpp"
#include "infra/fs/FlockFileLock.hpp"

int main() {
    try {
        testsupport::TempDir tmp;
        const auto path = tmp.path() / "bendoregon.lock";

        infra::fs::FlockFileLock first;
        infra::fs::FlockFileLock second;

        if (!first.tryAcquire(path)) {
            std::cerr << "Expected first acquire to succeed\n";
            return 1;
        }
        if (!std::filesystem::exists(path)) {
            std::cerr << "Expected lock file to be created\n";
            return 1;
        }
        if (second.tryAcquire(path)) {
            std::cerr << "Expected a second holder to be refused\n";
            return 1;
        }
        if (first.tryAcquire(path)) {
            std::cerr << "Expected re-acquire by the holder to be refused\n";
            return 1;
        }

        first.release(path);
        if (!second.tryAcquire(path)) {
            std::cerr << "Expected lock to be available after release\n";
            return 1;
        }
        second.release(path);

        // Releasing a path that is not held is a no-op.
        second.release(tmp.path() / "other.lock");

        {
            infra::fs::FlockFileLock scoped;
            if (!scoped.tryAcquire(path)) {
                std::cerr << "Expected scoped acquire to succeed\n";
                return 1;
            }
        }
        if (!first.tryAcquire(path)) {
            std::cerr << "Expected destructor to drop held locks\n";
            return 1;
        }
        first.release(path);
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
