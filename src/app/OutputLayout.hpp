#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "domain/Records.hpp"

namespace app {

// File naming inside the output directory:
//   {channel}_{type}.parquet                consolidated
//   {channel}_{type}.chunk_{seq:04d}.parquet unmerged chunk
//   {channel}_{type}.chunk_existing.parquet  previous consolidated file during a refresh merge
//   {channel}_{type}.cursor.json             checkpoint
//   {channel}.lock                          channel lock
class OutputLayout {
public:
    explicit OutputLayout(std::filesystem::path outputDir);

    const std::filesystem::path& outputDir() const { return outputDir_; }

    std::string prefix(const std::string& channel, domain::ContentType type) const;

    std::filesystem::path consolidated(const std::string& channel, domain::ContentType type) const;
    std::filesystem::path chunk(const std::string& channel, domain::ContentType type, std::uint64_t seq) const;
    std::filesystem::path existingAsChunk(const std::string& channel, domain::ContentType type) const;
    std::filesystem::path cursor(const std::string& channel, domain::ContentType type) const;
    std::filesystem::path lock(const std::string& channel) const;

    // Numbered chunk files only, in sequence order.
    std::vector<std::filesystem::path> listChunks(const std::string& channel, domain::ContentType type) const;

private:
    std::filesystem::path outputDir_;
};

}  // namespace app
