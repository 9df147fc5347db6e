#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "app/CheckpointStore.hpp"
#include "app/ChunkMerger.hpp"
#include "app/ChunkWriter.hpp"
#include "app/IngestStats.hpp"
#include "app/OutputLayout.hpp"
#include "app/PageFetcher.hpp"
#include "app/ResourceGovernor.hpp"
#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace app {

struct TypeIngestResult {
    bool success{true};
    bool resumed{false};
    std::uint64_t rowsDownloaded{0};
    std::uint64_t rowsFlushed{0};
    std::optional<std::int64_t> frontier;
    std::string error;
};

// Runs one (channel, content type) from start-up reconciliation through the
// page loop to the final merge. Failures to fetch are returned; I/O and
// storage errors propagate as exceptions.
class ChannelIngestor {
public:
    struct Settings {
        std::int64_t after{0};
        std::size_t pageSize{100};
        std::chrono::milliseconds pageDelay{500};
        std::uint64_t maxRows{50'000};
        ChunkWriter::Limits chunkLimits{};
    };

    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    ChannelIngestor(Settings settings,
                    const OutputLayout& layout,
                    domain::IRecordFileStore& store,
                    CheckpointStore& checkpoints,
                    ChunkMerger& merger,
                    PageFetcher& fetcher,
                    ResourceGovernor& governor,
                    IngestStats& stats,
                    SleepFn sleep);

    TypeIngestResult ingest(const std::string& channel, domain::ContentType type);

private:
    // Applies the checkpoint/chunk consistency rule and returns the cursor to
    // resume from, if any.
    std::optional<Checkpoint> reconcile_(const std::string& channel, domain::ContentType type);

    Settings settings_;
    const OutputLayout& layout_;
    domain::IRecordFileStore& store_;
    CheckpointStore& checkpoints_;
    ChunkMerger& merger_;
    PageFetcher& fetcher_;
    ResourceGovernor& governor_;
    IngestStats& stats_;
    SleepFn sleep_;
};

}  // namespace app
