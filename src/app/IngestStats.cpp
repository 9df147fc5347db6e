#include "app/IngestStats.hpp"

#include <iomanip>
#include <sstream>

namespace app {

std::string IngestStats::summary() const {
    std::ostringstream out;
    out << "checked=" << channelsChecked << " downloaded=" << channelsDownloaded
        << " fresh=" << channelsSkippedFresh << " locked=" << channelsSkippedLocked
        << " failed=" << channelsFailed << " resumed=" << channelsResumed << " posts=" << postsDownloaded
        << " comments=" << commentsDownloaded << " dropped=" << recordsDropped
        << " requests=" << totalRequests << " bytes=" << totalBytesDownloaded
        << " parquet_bytes=" << totalParquetBytes << " dlq_written=" << dlqEntriesWritten
        << " dlq_promoted=" << dlqEntriesPromoted;
    if (circuitBreakerTripped) {
        out << " circuit_breaker=tripped skipped=" << channelsSkippedByBreaker.size();
    }
    if (requestCapHit) {
        out << " request_cap=hit";
    }
    if (durationCapHit) {
        out << " duration_cap=hit";
    }
    out << ' ' << std::fixed << std::setprecision(1) << elapsedSeconds << 's';
    return out.str();
}

}  // namespace app
