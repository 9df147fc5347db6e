#include "app/ChunkMerger.hpp"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/TimeUtils.hpp"

namespace fs = std::filesystem;

namespace app {
namespace {

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

// Leftovers only: a file that survives is picked up again on the next start.
void removeLeftover(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("ChunkMerger: unable to remove " << path.string() << ": " << ec.message());
    }
}

void renameOrThrow(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw std::runtime_error("Unable to rename " + from.string() + " to " + to.string() + ": " + ec.message());
    }
}

}  // namespace

ChunkMerger::ChunkMerger(const OutputLayout& layout,
                         domain::IRecordFileStore& store,
                         domain::IAtomicWriter& writer,
                         CheckpointStore& checkpoints)
    : layout_(layout), store_(store), writer_(writer), checkpoints_(checkpoints) {}

void ChunkMerger::removeChunks(const std::string& channel, domain::ContentType type) {
    for (const auto& chunk : layout_.listChunks(channel, type)) {
        removeLeftover(chunk);
    }
}

void ChunkMerger::restoreExisting_(const std::string& channel, domain::ContentType type) {
    const auto existing = layout_.existingAsChunk(channel, type);
    if (!pathExists(existing)) {
        return;
    }
    const auto consolidated = layout_.consolidated(channel, type);
    if (pathExists(consolidated)) {
        removeLeftover(existing);
        return;
    }
    renameOrThrow(existing, consolidated);
    LOG_INFO("ChunkMerger: restored " << consolidated.filename().string());
}

std::optional<Checkpoint> ChunkMerger::recover(const std::string& channel, domain::ContentType type) {
    const auto consolidated = layout_.consolidated(channel, type);
    const auto staged = writer_.stagingPath(consolidated);

    auto checkpoint = checkpoints_.load(channel, type);
    if (checkpoint.has_value() && checkpoint->mergePending) {
        if (!pathExists(staged) && pathExists(consolidated)) {
            LOG_INFO("ChunkMerger: completing interrupted merge for " << layout_.prefix(channel, type));
            removeChunks(channel, type);
            removeLeftover(layout_.existingAsChunk(channel, type));
            checkpoints_.remove(channel, type);
            return std::nullopt;
        }
        LOG_WARN("ChunkMerger: discarding unpublished merge output for " << layout_.prefix(channel, type));
        checkpoint->mergePending = false;
        checkpoints_.save(*checkpoint);
    }

    if (pathExists(staged)) {
        removeLeftover(staged);
    }
    restoreExisting_(channel, type);
    return checkpoint;
}

ChunkMerger::Result ChunkMerger::merge(const Checkpoint& state) {
    const auto& channel = state.channel;
    const auto type = state.type;

    Result result;
    const auto chunks = layout_.listChunks(channel, type);
    if (chunks.empty()) {
        checkpoints_.remove(channel, type);
        return result;
    }

    const auto consolidated = layout_.consolidated(channel, type);
    const auto existing = layout_.existingAsChunk(channel, type);
    const auto staged = writer_.stagingPath(consolidated);

    // Newest records first: the previous consolidated file, then chunks in
    // flush order.
    std::vector<fs::path> inputs;
    bool movedExisting = false;
    if (pathExists(consolidated)) {
        renameOrThrow(consolidated, existing);
        movedExisting = true;
        inputs.push_back(existing);
    }
    inputs.insert(inputs.end(), chunks.begin(), chunks.end());

    bool pendingSaved = false;
    try {
        const std::uint64_t existingRows = movedExisting ? store_.countRows(existing) : 0U;
        result.rows = store_.merge(type, inputs, staged);
        if (result.rows != existingRows + state.rowsFlushed) {
            throw std::runtime_error("merged " + std::to_string(result.rows) + " rows, expected " +
                                     std::to_string(existingRows + state.rowsFlushed));
        }

        Checkpoint pending = state;
        pending.mergePending = true;
        pending.updatedAt = chanarc::common::time::nowIsoUtc();
        checkpoints_.save(pending);
        pendingSaved = true;

        writer_.commit(staged, consolidated);
    } catch (const std::exception& ex) {
        LOG_ERR("ChunkMerger: merge failed for " << layout_.prefix(channel, type) << ": " << ex.what());
        removeLeftover(staged);
        if (movedExisting) {
            restoreExisting_(channel, type);
        }
        if (pendingSaved) {
            checkpoints_.save(state);
        }
        throw;
    }

    for (const auto& chunk : chunks) {
        removeLeftover(chunk);
    }
    if (movedExisting) {
        removeLeftover(existing);
    }
    checkpoints_.remove(channel, type);

    result.merged = true;
    result.inputs = inputs.size();
    LOG_INFO("ChunkMerger: merged " << result.rows << " rows from " << result.inputs << " files into "
                                    << consolidated.filename().string());
    return result;
}

}  // namespace app
