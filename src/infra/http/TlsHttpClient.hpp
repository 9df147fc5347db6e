#pragma once

#include <string>
#include <utility>
#include <vector>

namespace infra::http {

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string final_host;
    std::string final_target;
};

struct RequestOptions {
    int timeout_sec = 30;
    std::string user_agent = "chanarc-ingest/0.1";
};

// Performs an HTTPS GET, following up to five redirects. Any HTTP status is
// returned to the caller; DNS, connect, TLS and read failures throw
// std::runtime_error.
HttpResponse https_get(const std::string& host, const std::string& target, const RequestOptions& options = {});

// Percent-encodes a query component (RFC 3986 unreserved characters pass through).
std::string url_encode(const std::string& value);

// Builds "path?k1=v1&k2=v2" with encoded values.
std::string build_target(const std::string& path, const std::vector<std::pair<std::string, std::string>>& params);

}  // namespace infra::http
