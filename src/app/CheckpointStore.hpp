#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "app/OutputLayout.hpp"
#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace app {

// Resume state for one (channel, content type). oldestUtcSeen is the
// pagination frontier: the next page is requested with before=oldestUtcSeen.
struct Checkpoint {
    std::string channel;
    domain::ContentType type{domain::ContentType::Posts};
    std::optional<std::int64_t> oldestUtcSeen;
    std::uint64_t rowsFlushed{0};
    std::uint64_t chunksWritten{0};
    std::uint64_t pagesCompleted{0};
    std::string startedAt;
    std::string updatedAt;
    // Set between producing the merged output and removing the merge inputs.
    bool mergePending{false};
};

class CheckpointStore {
public:
    CheckpointStore(const OutputLayout& layout, domain::IAtomicWriter& writer);

    // Missing and unreadable cursor files both yield nullopt; the latter is
    // logged.
    std::optional<Checkpoint> load(const std::string& channel, domain::ContentType type) const;

    void save(const Checkpoint& checkpoint);
    void remove(const std::string& channel, domain::ContentType type);

    static std::string toJson(const Checkpoint& checkpoint);
    static std::optional<Checkpoint> fromJson(const std::string& text);

private:
    const OutputLayout& layout_;
    domain::IAtomicWriter& writer_;
};

}  // namespace app
