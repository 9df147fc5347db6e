#include <chrono>
#include <iostream>
#include <string>

#include <boost/json.hpp>

#include "TestSupport.hpp"
#include "app/PageFetcher.hpp"

namespace {

using testsupport::FakeArchive;
using testsupport::reply;

struct Harness {
    explicit Harness(int maxRetries)
        : fetcher(archive, app::PageFetcher::Config{maxRetries}, callbacks()) {}

    app::PageFetcher::Callbacks callbacks() {
        app::PageFetcher::Callbacks cb;
        cb.onRequest = [this]() { ++requests; };
        cb.sleep = [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); };
        return cb;
    }

    app::PageRequest request(const std::string& channel) const {
        app::PageRequest req;
        req.channel = channel;
        req.type = domain::ContentType::Posts;
        req.after = testsupport::kDefaultAfter;
        req.pageSize = 100;
        return req;
    }

    FakeArchive archive;
    int requests{0};
    std::vector<std::chrono::milliseconds> sleeps;
    app::PageFetcher fetcher;
};

int testClassification() {
    using app::FetchOutcome;
    using app::PageFetcher;
    if (PageFetcher::classify(200) != FetchOutcome::Success || PageFetcher::classify(404) != FetchOutcome::NotFound ||
        PageFetcher::classify(429) != FetchOutcome::RetryableError ||
        PageFetcher::classify(500) != FetchOutcome::RetryableError ||
        PageFetcher::classify(503) != FetchOutcome::RetryableError ||
        PageFetcher::classify(400) != FetchOutcome::BadRequest ||
        PageFetcher::classify(403) != FetchOutcome::BadRequest) {
        std::cerr << "Unexpected status classification\n";
        return 1;
    }
    if (PageFetcher::backoffFor(0).count() != 2 || PageFetcher::backoffFor(1).count() != 4 ||
        PageFetcher::backoffFor(2).count() != 8) {
        std::cerr << "Expected backoff of 2s, 4s, 8s\n";
        return 1;
    }
    return 0;
}

int testRetryThenSuccess() {
    Harness h(3);
    h.archive.addRecords("bend", domain::ContentType::Posts, {1700000002, 1700000001});
    h.archive.enqueueStatus("bend", 429);

    const auto result = h.fetcher.fetch(h.request("bend"));
    if (result.outcome != app::FetchOutcome::Success || result.records.size() != 2 || result.attempts != 2) {
        std::cerr << "Expected success on second attempt, got " << app::fetchOutcomeLabel(result.outcome) << "\n";
        return 1;
    }
    if (h.requests != 2 || h.sleeps.size() != 1 || h.sleeps[0] != std::chrono::milliseconds(2000)) {
        std::cerr << "Expected two counted requests and one 2s backoff\n";
        return 1;
    }
    if (result.bytes == 0) {
        std::cerr << "Expected body bytes to be reported\n";
        return 1;
    }
    return 0;
}

int testRetriesExhausted() {
    Harness h(3);
    h.archive.alwaysStatus("bend", 503);

    const auto result = h.fetcher.fetch(h.request("bend"));
    if (result.outcome != app::FetchOutcome::PermanentFailure || result.attempts != 4 || h.requests != 4) {
        std::cerr << "Expected permanent failure after 4 attempts, got attempts=" << result.attempts << "\n";
        return 1;
    }
    if (h.sleeps.size() != 3 || h.sleeps[2] != std::chrono::milliseconds(8000)) {
        std::cerr << "Expected three backoff waits ending with 8s\n";
        return 1;
    }
    if (result.error != "HTTP 503") {
        std::cerr << "Unexpected error text: " << result.error << "\n";
        return 1;
    }
    return 0;
}

int testTransportFaultIsRetried() {
    Harness h(1);
    h.archive.addRecords("bend", domain::ContentType::Posts, {1700000000});
    h.archive.enqueueTransportError("bend", "connection reset");

    const auto result = h.fetcher.fetch(h.request("bend"));
    if (result.outcome != app::FetchOutcome::Success || h.requests != 2) {
        std::cerr << "Expected transport fault to be retried\n";
        return 1;
    }

    Harness failing(0);
    failing.archive.enqueueTransportError("bend", "timeout");
    const auto failed = failing.fetcher.fetch(failing.request("bend"));
    if (failed.outcome != app::FetchOutcome::PermanentFailure || failed.error != "timeout" ||
        !failing.sleeps.empty()) {
        std::cerr << "Expected fault without retries to fail permanently with no wait\n";
        return 1;
    }
    return 0;
}

int testNonRetryableStatuses() {
    struct Case {
        unsigned status;
        app::FetchOutcome expected;
    };
    for (const auto& c : {Case{404, app::FetchOutcome::NotFound}, Case{400, app::FetchOutcome::BadRequest},
                          Case{401, app::FetchOutcome::BadRequest}}) {
        Harness h(3);
        h.archive.enqueueStatus("bend", c.status);
        const auto result = h.fetcher.fetch(h.request("bend"));
        if (result.outcome != c.expected || h.requests != 1 || !h.sleeps.empty()) {
            std::cerr << "Expected HTTP " << c.status << " to end without retry\n";
            return 1;
        }
    }
    return 0;
}

int testBodyHandling() {
    {
        Harness h(3);
        h.archive.enqueue("bend", [](const domain::ArchiveQuery&) { return reply(200, "<html>oops</html>"); });
        const auto result = h.fetcher.fetch(h.request("bend"));
        if (result.outcome != app::FetchOutcome::PermanentFailure || h.requests != 1) {
            std::cerr << "Expected invalid JSON to fail without retry\n";
            return 1;
        }
    }
    {
        Harness h(3);
        h.archive.enqueue("bend", [](const domain::ArchiveQuery&) {
            return reply(200, R"({"error":"Timeout. Maybe slow down a bit","data":null})");
        });
        const auto result = h.fetcher.fetch(h.request("bend"));
        if (result.outcome != app::FetchOutcome::EmptyPage) {
            std::cerr << "Expected error field to end pagination\n";
            return 1;
        }
    }
    {
        Harness h(3);
        h.archive.enqueue("bend", [](const domain::ArchiveQuery&) { return reply(200, R"({"data":[]})"); });
        if (h.fetcher.fetch(h.request("bend")).outcome != app::FetchOutcome::EmptyPage) {
            std::cerr << "Expected empty data to be an empty page\n";
            return 1;
        }
    }
    {
        Harness h(3);
        h.archive.enqueue("bend", [](const domain::ArchiveQuery&) {
            boost::json::array items;
            items.push_back(testsupport::postItem("bend", 1700000005));
            items.push_back(boost::json::object{{"title", "no id"}, {"created_utc", 1700000004}});
            items.push_back(boost::json::value("not an object"));
            items.push_back(testsupport::postItem("bend", 1700000003));
            return reply(200, testsupport::pageBody(items));
        });
        const auto result = h.fetcher.fetch(h.request("bend"));
        if (result.outcome != app::FetchOutcome::Success || result.records.size() != 2 || result.dropped != 2) {
            std::cerr << "Expected 2 records and 2 dropped items, got " << result.records.size() << "/"
                      << result.dropped << "\n";
            return 1;
        }
        if (domain::createdUtcOf(result.records.back()) != 1700000003) {
            std::cerr << "Expected records in upstream order\n";
            return 1;
        }
    }
    return 0;
}

int testCursorIsForwarded() {
    Harness h(0);
    auto req = h.request("bend");
    req.type = domain::ContentType::Comments;
    req.before = 1700000100;
    req.pageSize = 25;
    h.fetcher.fetch(req);

    const auto& queries = h.archive.queries();
    if (queries.size() != 1 || queries[0].before != std::optional<std::int64_t>{1700000100} ||
        queries[0].limit != 25 || queries[0].type != domain::ContentType::Comments ||
        queries[0].after != testsupport::kDefaultAfter) {
        std::cerr << "Expected request fields to be forwarded to the transport\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main() {
    try {
        if (testClassification() != 0 || testRetryThenSuccess() != 0 || testRetriesExhausted() != 0 ||
            testTransportFaultIsRetried() != 0 || testNonRetryableStatuses() != 0 || testBodyHandling() != 0 ||
            testCursorIsForwarded() != 0) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
