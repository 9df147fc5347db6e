#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::arcticshift {

class ArcticShiftTransport : public domain::IArchiveTransport {
public:
    static constexpr const char* kDefaultHost = "arctic-shift.photon-reddit.com";

    explicit ArcticShiftTransport(std::string host = kDefaultHost, infra::http::RequestOptions options = {});
    ~ArcticShiftTransport() override = default;

    domain::ArchiveReply search(const domain::ArchiveQuery& query) override;

    // Exposed for tests: the request target for a query, without the host.
    static std::string buildTarget(const domain::ArchiveQuery& query);

private:
    std::string host_;
    infra::http::RequestOptions options_;
};

}  // namespace adapters::arcticshift
