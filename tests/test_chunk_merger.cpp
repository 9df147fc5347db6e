#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "adapters/duckdb/DuckParquetStore.hpp"
#include "app/CheckpointStore.hpp"
#include "app/ChunkMerger.hpp"
#include "app/OutputLayout.hpp"
#include "infra/fs/AtomicFileWriter.hpp"

namespace fs = std::filesystem;

namespace {

constexpr auto kPosts = domain::ContentType::Posts;

// Delegates to the real store; merge can be made to fail.
class FailingMergeStore : public domain::IRecordFileStore {
public:
    explicit FailingMergeStore(domain::IRecordFileStore& inner) : inner_(inner) {}

    std::uint64_t writeRecords(domain::ContentType type,
                               const std::vector<domain::Record>& records,
                               const fs::path& dest) override {
        return inner_.writeRecords(type, records, dest);
    }

    std::uint64_t merge(domain::ContentType type, const std::vector<fs::path>& inputs, const fs::path& dest) override {
        if (failMerge) {
            // Leave a partial output behind like an engine dying mid-write.
            inner_.merge(type, inputs, dest);
            throw std::runtime_error("simulated merge failure");
        }
        return inner_.merge(type, inputs, dest);
    }

    std::optional<std::int64_t> minCreatedUtc(const fs::path& file) override { return inner_.minCreatedUtc(file); }
    std::uint64_t countRows(const fs::path& file) override { return inner_.countRows(file); }

    bool failMerge{false};

private:
    domain::IRecordFileStore& inner_;
};

std::vector<domain::Record> posts(std::int64_t newest, std::size_t count) {
    std::vector<domain::Record> records;
    for (const auto utc : testsupport::descendingTimestamps(newest, count)) {
        domain::PostRecord post;
        post.id = "p" + std::to_string(utc);
        post.channel = "bend";
        post.createdUtc = utc;
        records.emplace_back(post);
    }
    return records;
}

struct Fixture {
    testsupport::TempDir tmp;
    app::OutputLayout layout{tmp.path()};
    infra::fs::AtomicFileWriter writer;
    adapters::duckdb::DuckParquetStore duck{writer};
    FailingMergeStore store{duck};
    app::CheckpointStore checkpoints{layout, writer};
    app::ChunkMerger merger{layout, store, writer, checkpoints};

    // Writes chunks of the given sizes and the matching cursor.
    app::Checkpoint writeChunks(std::int64_t newest, const std::vector<std::size_t>& sizes) {
        app::Checkpoint state;
        state.channel = "bend";
        state.type = kPosts;
        for (const auto size : sizes) {
            store.writeRecords(kPosts, posts(newest, size), layout.chunk("bend", kPosts, state.chunksWritten));
            newest -= static_cast<std::int64_t>(size);
            state.chunksWritten += 1;
            state.rowsFlushed += size;
            state.oldestUtcSeen = newest + 1;
        }
        checkpoints.save(state);
        return state;
    }
};

std::vector<std::int64_t> createdOrder(adapters::duckdb::DuckParquetStore& store, const fs::path& file) {
    std::vector<std::int64_t> order;
    for (const auto& record : store.readRecords(kPosts, file)) {
        order.push_back(domain::createdUtcOf(record));
    }
    return order;
}

int testMergeInOrder() {
    Fixture f;
    // Previous consolidated file holds the newest rows.
    f.store.writeRecords(kPosts, posts(2000, 5), f.layout.consolidated("bend", kPosts));
    const auto state = f.writeChunks(1995, {3, 2});

    const auto result = f.merger.merge(state);
    if (!result.merged || result.rows != 10 || result.inputs != 3) {
        std::cerr << "Expected 10 rows from 3 inputs, got " << result.rows << "/" << result.inputs << "\n";
        return 1;
    }
    const auto order = createdOrder(f.duck, f.layout.consolidated("bend", kPosts));
    if (order != testsupport::descendingTimestamps(2000, 10)) {
        std::cerr << "Expected existing rows first, then chunks in flush order\n";
        return 1;
    }
    if (!f.layout.listChunks("bend", kPosts).empty() || fs::exists(f.layout.cursor("bend", kPosts)) ||
        fs::exists(f.layout.existingAsChunk("bend", kPosts)) ||
        fs::exists(f.writer.stagingPath(f.layout.consolidated("bend", kPosts)))) {
        std::cerr << "Expected merge inputs, staging file and cursor to be removed\n";
        return 1;
    }
    return 0;
}

int testMergeWithoutChunks() {
    Fixture f;
    app::Checkpoint state;
    state.channel = "bend";
    state.type = kPosts;
    f.checkpoints.save(state);

    const auto result = f.merger.merge(state);
    if (result.merged || fs::exists(f.layout.cursor("bend", kPosts)) ||
        fs::exists(f.layout.consolidated("bend", kPosts))) {
        std::cerr << "Expected an empty merge to only drop the cursor\n";
        return 1;
    }
    return 0;
}

int testFailedMergeKeepsInputs() {
    Fixture f;
    f.store.writeRecords(kPosts, posts(2000, 4), f.layout.consolidated("bend", kPosts));
    const auto state = f.writeChunks(1996, {2, 2});
    f.store.failMerge = true;

    bool threw = false;
    try {
        f.merger.merge(state);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Expected merge failure to propagate\n";
        return 1;
    }

    const auto cursor = f.checkpoints.load("bend", kPosts);
    if (f.layout.listChunks("bend", kPosts).size() != 2 || !cursor.has_value() || cursor->mergePending ||
        cursor->rowsFlushed != 4) {
        std::cerr << "Expected chunks and cursor to survive a failed merge\n";
        return 1;
    }
    if (f.store.countRows(f.layout.consolidated("bend", kPosts)) != 4 ||
        fs::exists(f.layout.existingAsChunk("bend", kPosts)) ||
        fs::exists(f.writer.stagingPath(f.layout.consolidated("bend", kPosts)))) {
        std::cerr << "Expected previous consolidated file to be restored untouched\n";
        return 1;
    }

    // The same state merges cleanly on the next attempt.
    f.store.failMerge = false;
    const auto retry = f.merger.merge(*cursor);
    if (!retry.merged || retry.rows != 8) {
        std::cerr << "Expected retry to merge 8 rows\n";
        return 1;
    }
    return 0;
}

int testRecoverCommittedMerge() {
    Fixture f;
    auto state = f.writeChunks(2000, {3});
    // Crash after the rename, before the inputs were deleted.
    f.store.merge(kPosts, f.layout.listChunks("bend", kPosts), f.layout.consolidated("bend", kPosts));
    state.mergePending = true;
    f.checkpoints.save(state);

    const auto recovered = f.merger.recover("bend", kPosts);
    if (recovered.has_value() || !f.layout.listChunks("bend", kPosts).empty() ||
        fs::exists(f.layout.cursor("bend", kPosts))) {
        std::cerr << "Expected committed merge to be completed on recovery\n";
        return 1;
    }
    if (f.store.countRows(f.layout.consolidated("bend", kPosts)) != 3) {
        std::cerr << "Expected consolidated file to be kept\n";
        return 1;
    }
    return 0;
}

int testRecoverUncommittedMerge() {
    Fixture f;
    const auto consolidated = f.layout.consolidated("bend", kPosts);
    f.store.writeRecords(kPosts, posts(2000, 2), consolidated);
    auto state = f.writeChunks(1998, {2});

    // Crash after staging the output, before the rename.
    fs::rename(consolidated, f.layout.existingAsChunk("bend", kPosts));
    std::vector<fs::path> inputs{f.layout.existingAsChunk("bend", kPosts)};
    const auto chunks = f.layout.listChunks("bend", kPosts);
    inputs.insert(inputs.end(), chunks.begin(), chunks.end());
    f.store.merge(kPosts, inputs, f.writer.stagingPath(consolidated));
    state.mergePending = true;
    f.checkpoints.save(state);

    const auto recovered = f.merger.recover("bend", kPosts);
    if (!recovered.has_value() || recovered->mergePending || recovered->chunksWritten != 1) {
        std::cerr << "Expected uncommitted merge to roll back to the cursor\n";
        return 1;
    }
    const auto reloaded = f.checkpoints.load("bend", kPosts);
    if (!reloaded.has_value() || reloaded->mergePending) {
        std::cerr << "Expected merge_pending to be cleared on disk\n";
        return 1;
    }
    if (fs::exists(f.writer.stagingPath(consolidated)) || fs::exists(f.layout.existingAsChunk("bend", kPosts)) ||
        f.store.countRows(consolidated) != 2 || f.layout.listChunks("bend", kPosts).size() != 1) {
        std::cerr << "Expected staging removed, previous file restored and chunks kept\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main() {
    try {
        if (testMergeInOrder() != 0 || testMergeWithoutChunks() != 0 || testFailedMergeKeepsInputs() != 0 ||
            testRecoverCommittedMerge() != 0 || testRecoverUncommittedMerge() != 0) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
