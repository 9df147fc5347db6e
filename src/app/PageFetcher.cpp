#include "app/PageFetcher.hpp"

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"

namespace app {

const char* fetchOutcomeLabel(FetchOutcome outcome) {
    switch (outcome) {
    case FetchOutcome::Success:
        return "success";
    case FetchOutcome::EmptyPage:
        return "empty";
    case FetchOutcome::NotFound:
        return "not_found";
    case FetchOutcome::BadRequest:
        return "bad_request";
    case FetchOutcome::RetryableError:
        return "retryable";
    case FetchOutcome::PermanentFailure:
        return "permanent_failure";
    }
    return "unknown";
}

PageFetcher::PageFetcher(domain::IArchiveTransport& transport, Config config, Callbacks callbacks)
    : transport_(transport), config_(config), callbacks_(std::move(callbacks)) {
    if (!callbacks_.sleep) {
        callbacks_.sleep = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

FetchOutcome PageFetcher::classify(unsigned status) {
    if (status == 200U) {
        return FetchOutcome::Success;
    }
    if (status == 404U) {
        return FetchOutcome::NotFound;
    }
    if (status == 429U || status == 503U || status >= 500U) {
        return FetchOutcome::RetryableError;
    }
    return FetchOutcome::BadRequest;
}

std::chrono::seconds PageFetcher::backoffFor(int attempt) {
    return std::chrono::seconds(1LL << (attempt + 1));
}

FetchResult PageFetcher::fetch(const PageRequest& request) {
    domain::ArchiveQuery query;
    query.channel = request.channel;
    query.type = request.type;
    query.after = request.after;
    query.before = request.before;
    query.limit = request.pageSize;

    const auto label = request.channel + "/" + domain::contentTypeLabel(request.type);

    FetchResult result;
    for (int attempt = 0; attempt <= config_.maxRetries; ++attempt) {
        result.attempts = attempt + 1;
        if (callbacks_.onRequest) {
            callbacks_.onRequest();
        }

        std::optional<domain::ArchiveReply> reply;
        try {
            reply = transport_.search(query);
        } catch (const std::exception& ex) {
            result.status = 0U;
            result.error = ex.what();
        }

        FetchOutcome outcome = FetchOutcome::RetryableError;
        if (reply.has_value()) {
            result.status = reply->status;
            outcome = classify(reply->status);
            if (outcome == FetchOutcome::RetryableError) {
                result.error = "HTTP " + std::to_string(reply->status);
            }
        }

        switch (outcome) {
        case FetchOutcome::Success:
            parseBody_(request, reply->body, result);
            return result;
        case FetchOutcome::NotFound:
            LOG_WARN("PageFetcher: channel " << request.channel << " not found upstream (404)");
            result.outcome = outcome;
            return result;
        case FetchOutcome::BadRequest:
            if (reply->status == 400U) {
                LOG_WARN("PageFetcher: bad request for " << label << ": " << reply->body);
            } else {
                LOG_ERR("PageFetcher: unexpected HTTP " << reply->status << " for " << label);
            }
            result.outcome = outcome;
            result.error = "HTTP " + std::to_string(reply->status);
            return result;
        default:
            break;
        }

        if (attempt < config_.maxRetries) {
            const auto wait = backoffFor(attempt);
            LOG_INFO("PageFetcher: retry " << (attempt + 1) << '/' << config_.maxRetries << " for " << label << " ("
                                           << result.error << "), waiting " << wait.count() << 's');
            callbacks_.sleep(std::chrono::duration_cast<std::chrono::milliseconds>(wait));
        }
    }

    LOG_ERR("PageFetcher: giving up on " << label << " after " << result.attempts << " attempts: " << result.error);
    result.outcome = FetchOutcome::PermanentFailure;
    return result;
}

void PageFetcher::parseBody_(const PageRequest& request, const std::string& body, FetchResult& result) const {
    const auto label = request.channel + "/" + domain::contentTypeLabel(request.type);

    boost::json::error_code ec;
    auto parsed = boost::json::parse(body, ec);
    if (ec || !parsed.is_object()) {
        LOG_ERR("PageFetcher: invalid JSON from " << label);
        result.outcome = FetchOutcome::PermanentFailure;
        result.error = ec ? "invalid JSON: " + ec.message() : std::string{"invalid JSON: expected object"};
        return;
    }
    const auto& object = parsed.as_object();

    if (const auto* error = object.if_contains("error"); error != nullptr && !error->is_null()) {
        const bool blank = error->is_string() && error->get_string().empty();
        if (!blank) {
            LOG_WARN("PageFetcher: upstream error for " << label << ": " << boost::json::serialize(*error));
            result.outcome = FetchOutcome::EmptyPage;
            return;
        }
    }

    const auto* data = object.if_contains("data");
    if (data == nullptr || !data->is_array() || data->as_array().empty()) {
        result.outcome = FetchOutcome::EmptyPage;
        return;
    }

    result.outcome = FetchOutcome::Success;
    result.bytes = body.size();
    for (const auto& item : data->as_array()) {
        std::optional<domain::Record> record;
        if (item.is_object()) {
            record = domain::parseRecord(request.type, item.as_object());
        }
        if (!record.has_value()) {
            ++result.dropped;
            continue;
        }
        result.records.push_back(std::move(*record));
    }
    if (result.dropped > 0) {
        LOG_DEBUG("PageFetcher: dropped " << result.dropped << " items without id or created_utc in " << label);
    }
}

}  // namespace app
