#include <iostream>
#include <string>

#include "adapters/arcticshift/ArcticShiftTransport.hpp"
#include "infra/http/TlsHttpClient.hpp"

int main() {
    domain::ArchiveQuery query;
    query.channel = "bendoregon";
    query.type = domain::ContentType::Posts;
    query.after = 1672531200;
    query.limit = 100;

    const auto first = adapters::arcticshift::ArcticShiftTransport::buildTarget(query);
    const std::string expectedFirst =
        "/api/posts/search?subreddit=bendoregon&limit=100&sort=desc&sort_type=created_utc&after=1672531200";
    if (first != expectedFirst) {
        std::cerr << "Unexpected first page target: " << first << "\n";
        return 1;
    }

    query.type = domain::ContentType::Comments;
    query.before = 1700000000;
    const auto next = adapters::arcticshift::ArcticShiftTransport::buildTarget(query);
    const std::string expectedNext = "/api/comments/search?subreddit=bendoregon&limit=100&sort=desc"
                                     "&sort_type=created_utc&after=1672531200&before=1700000000";
    if (next != expectedNext) {
        std::cerr << "Unexpected follow-up target: " << next << "\n";
        return 1;
    }

    if (infra::http::url_encode("a b/c&d") != "a%20b%2Fc%26d") {
        std::cerr << "Unexpected url encoding: " << infra::http::url_encode("a b/c&d") << "\n";
        return 1;
    }

    return 0;
}
