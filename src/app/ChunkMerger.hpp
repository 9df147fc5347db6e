#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "app/CheckpointStore.hpp"
#include "app/OutputLayout.hpp"
#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace app {

// Folds the chunk files of one (channel, content type), preceded by the
// previous consolidated file when there is one, into a new consolidated
// file. Publication is two-phase: the merged output is staged, the cursor is
// marked merge_pending, the output is renamed into place, then the inputs
// and finally the cursor are deleted.
class ChunkMerger {
public:
    struct Result {
        bool merged{false};
        std::uint64_t rows{0};
        std::size_t inputs{0};
    };

    ChunkMerger(const OutputLayout& layout,
                domain::IRecordFileStore& store,
                domain::IAtomicWriter& writer,
                CheckpointStore& checkpoints);

    // Finishes or rolls back a merge interrupted by a crash and returns the
    // cursor to resume from (nullopt when none remains). Chunk/cursor
    // consistency is left to the caller.
    std::optional<Checkpoint> recover(const std::string& channel, domain::ContentType type);

    // state is the cursor matching the chunks on disk. On failure the chunks,
    // the cursor and the previous consolidated file are left as they were.
    Result merge(const Checkpoint& state);

    void removeChunks(const std::string& channel, domain::ContentType type);

private:
    void restoreExisting_(const std::string& channel, domain::ContentType type);

    const OutputLayout& layout_;
    domain::IRecordFileStore& store_;
    domain::IAtomicWriter& writer_;
    CheckpointStore& checkpoints_;
};

}  // namespace app
