#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace app {

enum class FetchOutcome {
    Success,          // 200 with items
    EmptyPage,        // 200 without items: end of data
    NotFound,         // 404: channel unknown upstream, no-op success
    BadRequest,       // 400 and other 4xx: skip the content type, not a failure
    RetryableError,   // 429 / 503 / 5xx / transport fault, only seen between attempts
    PermanentFailure  // retries exhausted or unparseable body: channel failure
};

const char* fetchOutcomeLabel(FetchOutcome outcome);

struct PageRequest {
    std::string channel;
    domain::ContentType type{domain::ContentType::Posts};
    std::int64_t after{0};
    std::optional<std::int64_t> before;
    std::size_t pageSize{100};
};

struct FetchResult {
    FetchOutcome outcome{FetchOutcome::EmptyPage};
    std::vector<domain::Record> records;
    std::size_t dropped{0};
    std::uint64_t bytes{0};
    unsigned status{0};
    int attempts{0};
    std::string error;
};

// Fetches one page, retrying transient outcomes with exponential backoff.
class PageFetcher {
public:
    struct Config {
        int maxRetries = 3;
    };

    struct Callbacks {
        // Invoked before every attempt, retries included.
        std::function<void()> onRequest;
        std::function<void(std::chrono::milliseconds)> sleep;
    };

    PageFetcher(domain::IArchiveTransport& transport, Config config, Callbacks callbacks);

    FetchResult fetch(const PageRequest& request);

    // Outcome implied by the status line alone; a 200 still depends on the body.
    static FetchOutcome classify(unsigned status);

    // Wait before retry number attempt + 1: 2^(attempt+1) seconds.
    static std::chrono::seconds backoffFor(int attempt);

private:
    void parseBody_(const PageRequest& request, const std::string& body, FetchResult& result) const;

    domain::IArchiveTransport& transport_;
    Config config_;
    Callbacks callbacks_;
};

}  // namespace app
