#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace app {

// Per-run counters returned by BackfillWorker::run(); the only error
// reporting surface of a job besides the dead-letter files.
struct IngestStats {
    std::uint64_t channelsChecked{0};
    std::uint64_t channelsDownloaded{0};
    std::uint64_t channelsSkippedFresh{0};
    std::uint64_t channelsSkippedLocked{0};
    std::uint64_t channelsFailed{0};
    std::uint64_t channelsResumed{0};

    std::uint64_t postsDownloaded{0};
    std::uint64_t commentsDownloaded{0};
    std::uint64_t recordsDropped{0};

    std::uint64_t totalRequests{0};
    std::uint64_t totalBytesDownloaded{0};
    std::uint64_t totalParquetBytes{0};

    std::uint64_t dlqEntriesWritten{0};
    std::uint64_t dlqEntriesPromoted{0};

    bool circuitBreakerTripped{false};
    bool requestCapHit{false};
    bool durationCapHit{false};

    std::vector<std::string> channelsSkippedByBreaker;

    double elapsedSeconds{0.0};

    std::string summary() const;
};

}  // namespace app
