#include "app/BackfillWorker.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "app/ChannelIngestor.hpp"
#include "app/CheckpointStore.hpp"
#include "app/ChunkMerger.hpp"
#include "app/CircuitBreaker.hpp"
#include "app/DeadLetterQueue.hpp"
#include "app/PageFetcher.hpp"
#include "app/ResourceGovernor.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace app {
namespace {

constexpr const char* kDefaultAfter = "2023-01-01";

std::vector<std::string> deduplicateList(std::vector<std::string> values) {
    std::vector<std::string> unique;
    unique.reserve(values.size());

    for (auto& value : values) {
        if (value.empty()) {
            continue;
        }
        if (std::find(unique.begin(), unique.end(), value) == unique.end()) {
            unique.push_back(std::move(value));
        }
    }

    return unique;
}

std::int64_t resolveAfter(const std::string& after) {
    if (auto parsed = chanarc::common::time::parseDateToSeconds(after)) {
        return *parsed;
    }
    LOG_WARN("BackfillWorker: invalid after date '" << after << "', using " << kDefaultAfter);
    return chanarc::common::time::parseDateToSeconds(kDefaultAfter).value_or(0);
}

// Holds a channel lock for the scope. The lock file is removed only after a
// successful channel; a failed channel leaves it in place.
class ChannelLock {
public:
    ChannelLock(domain::IFileLock& lock, fs::path path) : lock_(lock), path_(std::move(path)) {}
    ~ChannelLock() { release(false); }

    ChannelLock(const ChannelLock&) = delete;
    ChannelLock& operator=(const ChannelLock&) = delete;

    void release(bool removeFile) {
        if (!held_) {
            return;
        }
        held_ = false;
        try {
            lock_.release(path_);
        } catch (const std::exception& ex) {
            LOG_ERR("BackfillWorker: unable to release lock " << path_.string() << ": " << ex.what());
            return;
        }
        if (removeFile) {
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) {
                LOG_WARN("BackfillWorker: unable to remove lock file " << path_.string() << ": " << ec.message());
            }
        }
    }

private:
    domain::IFileLock& lock_;
    fs::path path_;
    bool held_{true};
};

struct ChannelFailure {
    std::string reason;
    std::optional<std::int64_t> frontier;
    std::uint64_t rows{0};
};

}  // namespace

BackfillWorker::BackfillWorker(const chanarc::common::Config& config, Dependencies deps, Hooks hooks)
    : config_(config),
      deps_(deps),
      hooks_(std::move(hooks)),
      channels_(deduplicateList(config.channels)),
      afterSeconds_(resolveAfter(config.after)),
      layout_(config.outputDir) {}

bool BackfillWorker::isFresh_(const std::string& channel, domain::ContentType type) const {
    if (config_.staleDays <= 0) {
        return false;
    }
    std::error_code ec;
    const auto modified = fs::last_write_time(layout_.consolidated(channel, type), ec);
    if (ec) {
        return false;
    }
    const auto age = fs::file_time_type::clock::now() - modified;
    return age < std::chrono::seconds(chanarc::common::time::kSecondsPerDay * config_.staleDays);
}

std::vector<domain::ContentType> BackfillWorker::staleTypes_(const std::string& channel) const {
    std::vector<domain::ContentType> stale;
    for (const auto type : config_.contentTypes) {
        if (!isFresh_(channel, type)) {
            stale.push_back(type);
        }
    }
    return stale;
}

IngestStats BackfillWorker::run() {
    IngestStats stats;

    ResourceGovernor governor({config_.maxTotalRequests, config_.maxDuration}, hooks_.now);
    CheckpointStore checkpoints(layout_, deps_.writer);
    ChunkMerger merger(layout_, deps_.store, deps_.writer, checkpoints);

    PageFetcher::Callbacks fetchCallbacks;
    fetchCallbacks.onRequest = [&governor]() { governor.recordRequest(); };
    fetchCallbacks.sleep = hooks_.sleep;
    PageFetcher fetcher(deps_.transport, PageFetcher::Config{config_.maxRetries}, fetchCallbacks);

    ChannelIngestor::Settings settings;
    settings.after = afterSeconds_;
    settings.pageSize = config_.pageSize;
    settings.pageDelay = config_.pageDelay;
    settings.maxRows = config_.maxRowsPerChannel;
    settings.chunkLimits.maxRows = config_.chunkSize;
    settings.chunkLimits.maxBytes = config_.maxBufferBytes;
    ChannelIngestor ingestor(settings, layout_, deps_.store, checkpoints, merger, fetcher, governor, stats,
                             hooks_.sleep);

    DeadLetterQueue deadLetters(config_.resolvedDeadLetterDir(), deps_.writer, config_.maxDlqAttempts);
    CircuitBreaker breaker(config_.circuitBreakerThreshold);

    LOG_INFO("BackfillWorker: starting channels=" << channels_.size() << " after=" << config_.after
                                                   << " output=" << layout_.outputDir().string());

    for (const auto& channel : channels_) {
        if (!domain::isValidChannelName(channel)) {
            LOG_WARN("BackfillWorker: invalid channel name '" << channel << "', skipping");
            continue;
        }

        ++stats.channelsChecked;

        if (breaker.tripped()) {
            LOG_INFO("BackfillWorker: circuit breaker tripped, skipping " << channel);
            stats.channelsSkippedByBreaker.push_back(channel);
            continue;
        }
        if (!governor.allowWork()) {
            LOG_INFO("BackfillWorker: resource cap reached, stopping before " << channel);
            break;
        }
        if (staleTypes_(channel).empty()) {
            ++stats.channelsSkippedFresh;
            LOG_INFO("BackfillWorker: " << channel << " is fresh, skipping");
            continue;
        }

        std::optional<ChannelFailure> failure;

        const auto lockPath = layout_.lock(channel);
        bool acquired = false;
        try {
            acquired = deps_.lock.tryAcquire(lockPath);
            if (!acquired) {
                ++stats.channelsSkippedLocked;
                LOG_INFO("BackfillWorker: " << channel << " is locked by another worker, skipping");
                continue;
            }
        } catch (const std::exception& ex) {
            LOG_ERR("BackfillWorker: unable to lock " << channel << ": " << ex.what());
            failure = ChannelFailure{std::string{"lock failed: "} + ex.what(), std::nullopt, 0};
        }

        std::optional<ChannelLock> guard;
        if (acquired) {
            guard.emplace(deps_.lock, lockPath);

            // Re-checked under the lock: another worker may have finished the
            // channel since the first check.
            const auto pending = staleTypes_(channel);
            if (pending.empty()) {
                ++stats.channelsSkippedFresh;
                LOG_INFO("BackfillWorker: " << channel << " became fresh, skipping");
                guard->release(true);
                continue;
            }

            for (const auto type : pending) {
                if (!governor.allowWork()) {
                    break;
                }
                const std::string label = domain::contentTypeLabel(type);
                try {
                    const auto result = ingestor.ingest(channel, type);
                    if (!result.success && !failure.has_value()) {
                        failure = ChannelFailure{label + ": " + result.error, result.frontier, result.rowsFlushed};
                    }
                } catch (const std::exception& ex) {
                    LOG_ERR("BackfillWorker: " << channel << '/' << label << " aborted: " << ex.what());
                    if (!failure.has_value()) {
                        failure = ChannelFailure{label + ": " + ex.what(), std::nullopt, 0};
                    }
                }
            }
        }

        if (!failure.has_value()) {
            ++stats.channelsDownloaded;
            breaker.recordSuccess();
            try {
                deadLetters.clear(channel);
            } catch (const std::exception& ex) {
                LOG_ERR("BackfillWorker: unable to clear dead-letter entry for " << channel << ": " << ex.what());
            }
            guard->release(true);
            continue;
        }

        ++stats.channelsFailed;
        try {
            const auto outcome =
                deadLetters.recordFailure(channel, "download failed: " + failure->reason, failure->frontier,
                                          failure->rows);
            ++stats.dlqEntriesWritten;
            if (outcome.promoted) {
                ++stats.dlqEntriesPromoted;
            }
        } catch (const std::exception& ex) {
            LOG_ERR("BackfillWorker: unable to dead-letter " << channel << ": " << ex.what());
        }
        if (breaker.recordFailure()) {
            stats.circuitBreakerTripped = true;
        }
        if (guard.has_value()) {
            guard->release(false);
        }
    }

    stats.totalRequests = governor.requests();
    stats.requestCapHit = governor.requestCapHit();
    stats.durationCapHit = governor.durationCapHit();
    stats.elapsedSeconds = governor.elapsed().count();

    LOG_INFO("BackfillWorker: finished " << stats.summary());
    return stats;
}

}  // namespace app
