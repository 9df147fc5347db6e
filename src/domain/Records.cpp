#include "domain/Records.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

namespace domain {
namespace {

constexpr std::size_t kRecordOverheadBytes = 64;

std::string json_to_text(const boost::json::value* value) {
    if (value == nullptr || value->is_null()) {
        return {};
    }
    if (value->is_string()) {
        return std::string{value->as_string().c_str(), value->as_string().size()};
    }
    if (value->is_bool()) {
        return value->as_bool() ? "True" : "False";
    }
    return boost::json::serialize(*value);
}

std::optional<std::int64_t> json_to_int64(const boost::json::value* value) {
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_int64()) {
        return value->as_int64();
    }
    if (value->is_uint64()) {
        const auto raw = value->as_uint64();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value->is_double()) {
        const double raw = value->as_double();
        if (!std::isfinite(raw)) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value->is_bool()) {
        return value->as_bool() ? 1 : 0;
    }
    if (value->is_string()) {
        const std::string str{value->as_string().c_str(), value->as_string().size()};
        try {
            std::size_t consumed = 0;
            const auto parsed = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(parsed);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> json_to_double(const boost::json::value* value) {
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_double()) {
        return value->as_double();
    }
    if (value->is_int64()) {
        return static_cast<double>(value->as_int64());
    }
    if (value->is_uint64()) {
        return static_cast<double>(value->as_uint64());
    }
    if (value->is_string()) {
        const std::string str{value->as_string().c_str(), value->as_string().size()};
        try {
            return std::stod(str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

const boost::json::value* field(const boost::json::object& item, const char* key) {
    return item.if_contains(key);
}

}  // namespace

std::optional<ContentType> contentTypeFromString(std::string_view text) {
    if (text == "posts" || text == "post" || text == "submissions") {
        return ContentType::Posts;
    }
    if (text == "comments" || text == "comment") {
        return ContentType::Comments;
    }
    return std::nullopt;
}

std::int64_t createdUtcOf(const Record& record) {
    return std::visit([](const auto& row) { return row.createdUtc; }, record);
}

const std::string& idOf(const Record& record) {
    return std::visit([](const auto& row) -> const std::string& { return row.id; }, record);
}

std::size_t estimateBytes(const Record& record) {
    if (const auto* post = std::get_if<PostRecord>(&record)) {
        return kRecordOverheadBytes + sizeof(PostRecord) + post->id.size() + post->channel.size() +
               post->title.size() + post->body.size() + post->permalink.size();
    }
    const auto& comment = std::get<CommentRecord>(record);
    return kRecordOverheadBytes + sizeof(CommentRecord) + comment.id.size() + comment.channel.size() +
           comment.body.size() + comment.permalink.size() + comment.linkId.size() +
           comment.parentId.size();
}

std::optional<Record> parseRecord(ContentType type, const boost::json::object& item) {
    const auto id = json_to_text(field(item, "id"));
    if (id.empty()) {
        return std::nullopt;
    }
    const auto createdUtc = json_to_int64(field(item, "created_utc"));
    if (!createdUtc.has_value()) {
        return std::nullopt;
    }

    if (type == ContentType::Posts) {
        PostRecord post;
        post.id = id;
        post.channel = json_to_text(field(item, "subreddit"));
        post.title = json_to_text(field(item, "title"));
        post.body = json_to_text(field(item, "selftext"));
        post.score = json_to_int64(field(item, "score")).value_or(0);
        post.createdUtc = *createdUtc;
        post.permalink = json_to_text(field(item, "permalink"));
        post.qualityRatio = json_to_double(field(item, "upvote_ratio")).value_or(0.0);
        post.replyCount = json_to_int64(field(item, "num_comments")).value_or(0);
        return Record{std::move(post)};
    }

    CommentRecord comment;
    comment.id = id;
    comment.channel = json_to_text(field(item, "subreddit"));
    comment.body = json_to_text(field(item, "body"));
    comment.score = json_to_int64(field(item, "score")).value_or(0);
    comment.createdUtc = *createdUtc;
    comment.permalink = json_to_text(field(item, "permalink"));
    comment.linkId = json_to_text(field(item, "link_id"));
    comment.parentId = json_to_text(field(item, "parent_id"));
    return Record{std::move(comment)};
}

bool isValidChannelName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    for (const char ch : name) {
        const auto uch = static_cast<unsigned char>(ch);
        if (!std::isalnum(uch) && ch != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace domain
