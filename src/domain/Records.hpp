#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/json/object.hpp>

namespace domain {

enum class ContentType {
    Posts,
    Comments,
};

inline const char* contentTypeLabel(ContentType type) {
    return type == ContentType::Posts ? "posts" : "comments";
}

std::optional<ContentType> contentTypeFromString(std::string_view text);

// Top-level submission. Column names on disk follow the archive's naming.
struct PostRecord {
    std::string id;
    std::string channel;
    std::string title;
    std::string body;
    std::int64_t score{0};
    std::int64_t createdUtc{0};
    std::string permalink;
    double qualityRatio{0.0};
    std::int64_t replyCount{0};
};

// Reply. linkId references the root submission, parentId the direct parent
// (comment or submission).
struct CommentRecord {
    std::string id;
    std::string channel;
    std::string body;
    std::int64_t score{0};
    std::int64_t createdUtc{0};
    std::string permalink;
    std::string linkId;
    std::string parentId;
};

using Record = std::variant<PostRecord, CommentRecord>;

std::int64_t createdUtcOf(const Record& record);
const std::string& idOf(const Record& record);

// Rough in-memory footprint, used by the buffer byte guard.
std::size_t estimateBytes(const Record& record);

// Returns nullopt when the item has no id or no integral created_utc; such
// items can never be ordered against the frontier.
std::optional<Record> parseRecord(ContentType type, const boost::json::object& item);

bool isValidChannelName(std::string_view name);

}  // namespace domain
