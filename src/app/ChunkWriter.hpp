#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "app/CheckpointStore.hpp"
#include "app/OutputLayout.hpp"
#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace app {

// Buffers records for one (channel, content type) and flushes them to
// numbered chunk files. Every flush is followed by a checkpoint rewrite, so
// the cursor on disk always describes exactly the chunks on disk.
class ChunkWriter {
public:
    struct Limits {
        std::size_t maxRows = 500;
        std::size_t maxBytes = 50'000'000;
    };

    // state is the checkpoint being resumed, or a fresh one with zero counts.
    ChunkWriter(const OutputLayout& layout,
                domain::IRecordFileStore& store,
                CheckpointStore& checkpoints,
                Checkpoint state,
                Limits limits);

    // Flushes once either limit is reached.
    void append(domain::Record record);

    void markPageCompleted() { ++state_.pagesCompleted; }

    // No-op when the buffer is empty.
    void flush();

    // Flushes the buffer and makes sure the checkpoint reflects every chunk
    // written so far. Never creates a checkpoint without chunks.
    void persistProgress();

    const Checkpoint& state() const { return state_; }

    // Oldest created_utc seen, buffered records included.
    std::optional<std::int64_t> frontier() const { return frontier_; }

    std::uint64_t rowsTotal() const { return state_.rowsFlushed + buffer_.size(); }
    std::size_t bufferedRows() const { return buffer_.size(); }
    std::size_t bufferedBytes() const { return bufferedBytes_; }
    std::uint64_t bytesWritten() const { return bytesWritten_; }

private:
    const OutputLayout& layout_;
    domain::IRecordFileStore& store_;
    CheckpointStore& checkpoints_;
    Checkpoint state_;
    Limits limits_;

    std::vector<domain::Record> buffer_;
    std::size_t bufferedBytes_{0};
    std::optional<std::int64_t> frontier_;
    std::uint64_t bytesWritten_{0};
};

}  // namespace app
