#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Records.hpp"

namespace chanarc::common {

struct Config {
    chanarc::log::Level logLevel = chanarc::log::Level::Info;

    std::vector<std::string> channels{};
    std::vector<domain::ContentType> contentTypes{domain::ContentType::Posts, domain::ContentType::Comments};

    std::string outputDir = "data/arctic_shift";
    std::string deadLetterDir;  // empty: <outputDir>/dead_letter

    std::string archiveHost = "arctic-shift.photon-reddit.com";
    int httpTimeoutSec = 30;
    std::string userAgent = "chanarc-ingest/0.1";

    std::string after = "2023-01-01";
    std::size_t pageSize = 100;
    std::chrono::milliseconds pageDelay{500};

    std::size_t maxRowsPerChannel = 50'000;
    std::size_t chunkSize = 500;
    std::size_t maxBufferBytes = 50'000'000;  // force-flush guard
    int maxRetries = 3;
    int circuitBreakerThreshold = 3;
    std::uint64_t maxTotalRequests = 5'000;
    std::chrono::seconds maxDuration{600};
    int staleDays = 7;
    int maxDlqAttempts = 5;

    std::string resolvedDeadLetterDir() const;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace chanarc::common
