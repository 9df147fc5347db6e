#include <iostream>
#include <string>
#include <variant>

#include <boost/json.hpp>

#include "domain/Records.hpp"

namespace {

boost::json::object parseObject(const char* text) {
    return boost::json::parse(text).as_object();
}

int testPostParsing() {
    const auto item = parseObject(R"({
        "id": "abc", "subreddit": "bendoregon", "author": "hidden", "title": "Hello",
        "selftext": "Body", "score": "12", "created_utc": 1700000000.9,
        "permalink": "/r/bendoregon/abc", "upvote_ratio": 0.5, "num_comments": null
    })");

    const auto record = domain::parseRecord(domain::ContentType::Posts, item);
    if (!record.has_value()) {
        std::cerr << "Expected post with id and created_utc to parse\n";
        return 1;
    }
    const auto* post = std::get_if<domain::PostRecord>(&*record);
    if (post == nullptr) {
        std::cerr << "Expected a PostRecord\n";
        return 1;
    }
    if (post->createdUtc != 1700000000 || post->score != 12 || post->replyCount != 0) {
        std::cerr << "Unexpected numeric coercion created=" << post->createdUtc << " score=" << post->score
                  << " replies=" << post->replyCount << "\n";
        return 1;
    }
    if (post->channel != "bendoregon" || post->title != "Hello" || post->body != "Body" || post->qualityRatio != 0.5) {
        std::cerr << "Unexpected text fields\n";
        return 1;
    }
    return 0;
}

int testCommentParsing() {
    const auto item = parseObject(R"({
        "id": 991, "subreddit": "x", "body": "reply", "created_utc": "1700000123",
        "link_id": "t3_root", "parent_id": "t1_parent"
    })");

    const auto record = domain::parseRecord(domain::ContentType::Comments, item);
    if (!record.has_value()) {
        std::cerr << "Expected comment with numeric id to parse\n";
        return 1;
    }
    const auto& comment = std::get<domain::CommentRecord>(*record);
    if (comment.id != "991" || comment.createdUtc != 1700000123 || comment.linkId != "t3_root" ||
        comment.parentId != "t1_parent" || comment.score != 0 || !comment.permalink.empty()) {
        std::cerr << "Unexpected comment fields id=" << comment.id << " created=" << comment.createdUtc << "\n";
        return 1;
    }
    if (domain::idOf(*record) != "991" || domain::createdUtcOf(*record) != 1700000123) {
        std::cerr << "Record accessors disagree with fields\n";
        return 1;
    }
    return 0;
}

int testDroppedItems() {
    const char* rejected[] = {
        R"({"created_utc": 1700000000})",
        R"({"id": "", "created_utc": 1700000000})",
        R"({"id": null, "created_utc": 1700000000})",
        R"({"id": "a"})",
        R"({"id": "a", "created_utc": null})",
        R"({"id": "a", "created_utc": "yesterday"})",
        R"({"id": "a", "created_utc": "17e8x"})",
    };
    for (const auto* text : rejected) {
        if (domain::parseRecord(domain::ContentType::Posts, parseObject(text)).has_value()) {
            std::cerr << "Expected item to be dropped: " << text << "\n";
            return 1;
        }
    }
    return 0;
}

int testContentTypesAndChannelNames() {
    if (domain::contentTypeFromString("posts") != domain::ContentType::Posts ||
        domain::contentTypeFromString("submissions") != domain::ContentType::Posts ||
        domain::contentTypeFromString("comment") != domain::ContentType::Comments ||
        domain::contentTypeFromString("threads").has_value()) {
        std::cerr << "Unexpected content type mapping\n";
        return 1;
    }
    if (std::string{domain::contentTypeLabel(domain::ContentType::Comments)} != "comments") {
        std::cerr << "Unexpected content type label\n";
        return 1;
    }

    if (!domain::isValidChannelName("bendoregon") || !domain::isValidChannelName("Ask_Portland2")) {
        std::cerr << "Expected alphanumeric channel names to be valid\n";
        return 1;
    }
    for (const char* bad : {"", "bend oregon", "../etc", "bend-oregon", "r/bend"}) {
        if (domain::isValidChannelName(bad)) {
            std::cerr << "Expected channel name to be rejected: '" << bad << "'\n";
            return 1;
        }
    }
    return 0;
}

int testSizeEstimate() {
    domain::PostRecord small;
    small.id = "a";
    domain::PostRecord large = small;
    large.body.assign(10'000, 'x');

    const auto smallBytes = domain::estimateBytes(domain::Record{small});
    const auto largeBytes = domain::estimateBytes(domain::Record{large});
    if (largeBytes < smallBytes + 10'000) {
        std::cerr << "Expected body size to count toward the estimate (" << smallBytes << " vs " << largeBytes
                  << ")\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main() {
    try {
        if (testPostParsing() != 0 || testCommentParsing() != 0 || testDroppedItems() != 0 ||
            testContentTypesAndChannelNames() != 0 || testSizeEstimate() != 0) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
