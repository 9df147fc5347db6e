#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "app/IngestStats.hpp"
#include "app/OutputLayout.hpp"
#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace chanarc::common {
struct Config;
}

namespace app {

// Job orchestrator: walks the configured channels one at a time and ingests
// every content type of each, with per-channel locking, freshness skipping,
// dead-lettering, circuit breaking and job-wide resource ceilings.
class BackfillWorker {
public:
    struct Dependencies {
        domain::IArchiveTransport& transport;
        domain::IFileLock& lock;
        domain::IAtomicWriter& writer;
        domain::IRecordFileStore& store;
    };

    struct Hooks {
        std::function<void(std::chrono::milliseconds)> sleep;
        std::function<std::chrono::steady_clock::time_point()> now;
    };

    BackfillWorker(const chanarc::common::Config& config, Dependencies deps, Hooks hooks = {});

    // Channel failures are contained and reported through the stats.
    IngestStats run();

private:
    bool isFresh_(const std::string& channel, domain::ContentType type) const;
    std::vector<domain::ContentType> staleTypes_(const std::string& channel) const;

    const chanarc::common::Config& config_;
    Dependencies deps_;
    Hooks hooks_;
    std::vector<std::string> channels_;
    std::int64_t afterSeconds_;
    OutputLayout layout_;
};

}  // namespace app
