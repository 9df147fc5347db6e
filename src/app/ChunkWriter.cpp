#include "app/ChunkWriter.hpp"

#include <utility>

#include "common/Log.hpp"
#include "common/TimeUtils.hpp"

namespace app {

ChunkWriter::ChunkWriter(const OutputLayout& layout,
                         domain::IRecordFileStore& store,
                         CheckpointStore& checkpoints,
                         Checkpoint state,
                         Limits limits)
    : layout_(layout),
      store_(store),
      checkpoints_(checkpoints),
      state_(std::move(state)),
      limits_(limits),
      frontier_(state_.oldestUtcSeen) {}

void ChunkWriter::append(domain::Record record) {
    const auto createdUtc = domain::createdUtcOf(record);
    if (!frontier_.has_value() || createdUtc < *frontier_) {
        frontier_ = createdUtc;
    }
    bufferedBytes_ += domain::estimateBytes(record);
    buffer_.push_back(std::move(record));

    if (buffer_.size() >= limits_.maxRows || bufferedBytes_ >= limits_.maxBytes) {
        flush();
    }
}

void ChunkWriter::flush() {
    if (buffer_.empty()) {
        return;
    }

    const auto path = layout_.chunk(state_.channel, state_.type, state_.chunksWritten);
    const auto bytes = store_.writeRecords(state_.type, buffer_, path);

    state_.chunksWritten += 1;
    state_.rowsFlushed += buffer_.size();
    state_.oldestUtcSeen = frontier_;
    state_.updatedAt = chanarc::common::time::nowIsoUtc();
    checkpoints_.save(state_);

    bytesWritten_ += bytes;
    LOG_DEBUG("ChunkWriter: flushed " << buffer_.size() << " rows to " << path.filename().string()
                                      << " bytes=" << bytes << " frontier=" << frontier_.value_or(0));

    buffer_.clear();
    bufferedBytes_ = 0;
}

void ChunkWriter::persistProgress() {
    if (!buffer_.empty()) {
        flush();
        return;
    }
    if (state_.chunksWritten > 0) {
        state_.updatedAt = chanarc::common::time::nowIsoUtc();
        checkpoints_.save(state_);
    }
}

}  // namespace app
