#include "app/ChannelIngestor.hpp"

#include <exception>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

#include "common/Log.hpp"
#include "common/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace app {

ChannelIngestor::ChannelIngestor(Settings settings,
                                 const OutputLayout& layout,
                                 domain::IRecordFileStore& store,
                                 CheckpointStore& checkpoints,
                                 ChunkMerger& merger,
                                 PageFetcher& fetcher,
                                 ResourceGovernor& governor,
                                 IngestStats& stats,
                                 SleepFn sleep)
    : settings_(settings),
      layout_(layout),
      store_(store),
      checkpoints_(checkpoints),
      merger_(merger),
      fetcher_(fetcher),
      governor_(governor),
      stats_(stats),
      sleep_(sleep ? std::move(sleep) : SleepFn{[](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }}) {}

std::optional<Checkpoint> ChannelIngestor::reconcile_(const std::string& channel, domain::ContentType type) {
    const auto prefix = layout_.prefix(channel, type);
    auto checkpoint = merger_.recover(channel, type);
    const auto chunks = layout_.listChunks(channel, type);

    if (checkpoint.has_value() && chunks.empty()) {
        LOG_WARN("ChannelIngestor: cursor without chunks for " << prefix << ", starting fresh");
        checkpoints_.remove(channel, type);
        return std::nullopt;
    }
    if (!checkpoint.has_value()) {
        if (!chunks.empty()) {
            LOG_WARN("ChannelIngestor: " << chunks.size() << " orphan chunks for " << prefix << ", cleaning up");
            merger_.removeChunks(channel, type);
        }
        // Also drops a cursor file that failed to parse.
        checkpoints_.remove(channel, type);
        return std::nullopt;
    }
    if (chunks.size() != checkpoint->chunksWritten) {
        LOG_WARN("ChannelIngestor: " << prefix << " has " << chunks.size() << " chunks but cursor records "
                                     << checkpoint->chunksWritten << ", starting fresh");
        merger_.removeChunks(channel, type);
        checkpoints_.remove(channel, type);
        return std::nullopt;
    }
    return checkpoint;
}

TypeIngestResult ChannelIngestor::ingest(const std::string& channel, domain::ContentType type) {
    const auto prefix = layout_.prefix(channel, type);
    TypeIngestResult result;

    auto checkpoint = reconcile_(channel, type);

    const auto consolidated = layout_.consolidated(channel, type);
    std::error_code ec;
    const bool refresh = fs::exists(consolidated, ec);
    std::optional<std::int64_t> refreshFrontier;
    if (refresh) {
        try {
            refreshFrontier = store_.minCreatedUtc(consolidated);
        } catch (const std::exception& ex) {
            LOG_WARN("ChannelIngestor: unable to read oldest created_utc of " << consolidated.filename().string()
                                                                              << ": " << ex.what());
        }
    }

    Checkpoint state;
    if (checkpoint.has_value()) {
        state = std::move(*checkpoint);
        result.resumed = true;
        ++stats_.channelsResumed;
        LOG_INFO("ChannelIngestor: resuming " << prefix << " from chunk " << state.chunksWritten
                                              << " rows=" << state.rowsFlushed
                                              << " oldest_utc=" << state.oldestUtcSeen.value_or(0));
    } else {
        state.channel = channel;
        state.type = type;
        state.startedAt = chanarc::common::time::nowIsoUtc();
        state.updatedAt = state.startedAt;
    }
    if (refreshFrontier.has_value() &&
        (!state.oldestUtcSeen.has_value() || *refreshFrontier < *state.oldestUtcSeen)) {
        state.oldestUtcSeen = refreshFrontier;
        LOG_INFO("ChannelIngestor: extending " << prefix << " backward from oldest_utc=" << *refreshFrontier);
    }

    const auto initialRows = state.rowsFlushed;
    ChunkWriter writer(layout_, store_, checkpoints_, std::move(state), settings_.chunkLimits);

    const auto finishCounters = [&]() {
        result.rowsFlushed = writer.state().rowsFlushed;
        result.rowsDownloaded = result.rowsFlushed - initialRows;
        result.frontier = writer.frontier();
        stats_.totalParquetBytes += writer.bytesWritten();
        if (type == domain::ContentType::Posts) {
            stats_.postsDownloaded += result.rowsDownloaded;
        } else {
            stats_.commentsDownloaded += result.rowsDownloaded;
        }
    };

    bool capped = false;
    while (writer.rowsTotal() < settings_.maxRows) {
        if (!governor_.allowWork()) {
            LOG_INFO("ChannelIngestor: resource cap reached, stopping " << prefix);
            capped = true;
            break;
        }

        PageRequest request;
        request.channel = channel;
        request.type = type;
        request.after = settings_.after;
        request.before = writer.frontier();
        request.pageSize = settings_.pageSize;

        auto page = fetcher_.fetch(request);
        stats_.recordsDropped += page.dropped;

        if (page.outcome == FetchOutcome::PermanentFailure || page.outcome == FetchOutcome::RetryableError) {
            writer.persistProgress();
            finishCounters();
            result.success = false;
            result.error = page.error;
            LOG_ERR("ChannelIngestor: " << prefix << " failed after " << writer.state().pagesCompleted
                                        << " pages: " << page.error);
            return result;
        }
        if (page.outcome != FetchOutcome::Success) {
            LOG_DEBUG("ChannelIngestor: " << prefix << " finished paging (" << fetchOutcomeLabel(page.outcome)
                                          << ')');
            break;
        }

        stats_.totalBytesDownloaded += page.bytes;
        for (auto& record : page.records) {
            if (writer.rowsTotal() >= settings_.maxRows) {
                LOG_INFO("ChannelIngestor: row cap " << settings_.maxRows << " reached for " << prefix);
                break;
            }
            writer.append(std::move(record));
        }
        writer.markPageCompleted();

        if (writer.frontier() == request.before) {
            LOG_WARN("ChannelIngestor: no progress for " << prefix << " before=" << request.before.value_or(0)
                                                         << ", stopping");
            break;
        }

        sleep_(settings_.pageDelay);
    }

    writer.flush();
    finishCounters();

    const auto merged = merger_.merge(writer.state());
    if (!merged.merged && refresh && !capped) {
        // Nothing older upstream: the existing file is current again. A cap
        // stop leaves it stale so the next run refreshes it.
        fs::last_write_time(consolidated, fs::file_time_type::clock::now(), ec);
        if (ec) {
            LOG_WARN("ChannelIngestor: unable to touch " << consolidated.filename().string() << ": " << ec.message());
        }
    }

    LOG_INFO("ChannelIngestor: " << prefix << " done rows=" << result.rowsDownloaded
                                 << " pages=" << writer.state().pagesCompleted);
    return result;
}

}  // namespace app
