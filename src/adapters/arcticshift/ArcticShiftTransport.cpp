#include "adapters/arcticshift/ArcticShiftTransport.hpp"

#include <string>
#include <utility>
#include <vector>

#include "common/Log.hpp"

namespace adapters::arcticshift {

ArcticShiftTransport::ArcticShiftTransport(std::string host, infra::http::RequestOptions options)
    : host_(std::move(host)), options_(std::move(options)) {
    if (host_.empty()) {
        host_ = kDefaultHost;
    }
}

std::string ArcticShiftTransport::buildTarget(const domain::ArchiveQuery& query) {
    std::vector<std::pair<std::string, std::string>> params;
    params.reserve(6);
    params.emplace_back("subreddit", query.channel);
    params.emplace_back("limit", std::to_string(query.limit));
    params.emplace_back("sort", "desc");
    params.emplace_back("sort_type", "created_utc");
    params.emplace_back("after", std::to_string(query.after));
    if (query.before.has_value()) {
        params.emplace_back("before", std::to_string(*query.before));
    }

    const std::string path = std::string{"/api/"} + domain::contentTypeLabel(query.type) + "/search";
    return infra::http::build_target(path, params);
}

domain::ArchiveReply ArcticShiftTransport::search(const domain::ArchiveQuery& query) {
    const auto target = buildTarget(query);
    LOG_DEBUG("ArcticShift GET https://" << host_ << target);

    auto response = infra::http::https_get(host_, target, options_);

    domain::ArchiveReply reply;
    reply.status = response.status;
    reply.body = std::move(response.body);
    return reply;
}

}  // namespace adapters::arcticshift
