#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace app {

struct DeadLetterEntry {
    std::string channel;
    std::string contentType{"all"};
    std::string reason;
    std::optional<std::int64_t> oldestUtcSeen;
    std::uint64_t rowsDownloaded{0};
    int attempts{0};
    std::string firstFailedAt;
    std::string lastFailedAt;
};

// Per-channel JSON-lines failure ledger:
//   <dir>/{channel}.jsonl            transient, retried on later runs
//   <dir>/{channel}_permanent.jsonl  entries that reached maxAttempts
// Every rewrite goes through the atomic writer.
class DeadLetterQueue {
public:
    using NowFn = std::function<std::string()>;

    struct FailureOutcome {
        int attempts{0};
        bool promoted{false};
    };

    DeadLetterQueue(std::filesystem::path directory,
                    domain::IAtomicWriter& writer,
                    int maxAttempts,
                    NowFn now = {});

    FailureOutcome recordFailure(const std::string& channel,
                                 const std::string& reason,
                                 std::optional<std::int64_t> oldestUtcSeen,
                                 std::uint64_t rowsDownloaded);

    // Drops the channel's transient entry; returns true if one existed.
    bool clear(const std::string& channel);

    std::vector<DeadLetterEntry> pending(const std::string& channel) const;
    std::vector<DeadLetterEntry> permanent(const std::string& channel) const;

    std::filesystem::path transientPath(const std::string& channel) const;
    std::filesystem::path permanentPath(const std::string& channel) const;

private:
    std::vector<DeadLetterEntry> readEntries_(const std::filesystem::path& path) const;
    void writeEntries_(const std::filesystem::path& path, const std::vector<DeadLetterEntry>& entries);

    std::filesystem::path directory_;
    domain::IAtomicWriter& writer_;
    int maxAttempts_;
    NowFn now_;
};

}  // namespace app
