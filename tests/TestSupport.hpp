#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

#include <boost/json.hpp>

#include "common/Config.hpp"
#include "domain/Ports.hpp"
#include "domain/Records.hpp"

namespace testsupport {

// Fresh directory under /tmp, removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "chanarc_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline boost::json::object postItem(const std::string& channel, std::int64_t createdUtc) {
    boost::json::object item;
    item["id"] = "p" + std::to_string(createdUtc);
    item["subreddit"] = channel;
    item["author"] = "someone";
    item["title"] = "title " + std::to_string(createdUtc);
    item["selftext"] = "body " + std::to_string(createdUtc);
    item["score"] = 3;
    item["created_utc"] = createdUtc;
    item["permalink"] = "/r/" + channel + "/comments/p" + std::to_string(createdUtc);
    item["upvote_ratio"] = 0.75;
    item["num_comments"] = 2;
    return item;
}

inline boost::json::object commentItem(const std::string& channel, std::int64_t createdUtc) {
    boost::json::object item;
    item["id"] = "c" + std::to_string(createdUtc);
    item["subreddit"] = channel;
    item["body"] = "reply " + std::to_string(createdUtc);
    item["score"] = 1;
    item["created_utc"] = createdUtc;
    item["permalink"] = "/r/" + channel + "/comments/x/c" + std::to_string(createdUtc);
    item["link_id"] = "t3_root";
    item["parent_id"] = "t1_parent";
    return item;
}

inline std::string pageBody(const boost::json::array& items) {
    boost::json::object body;
    body["data"] = items;
    return boost::json::serialize(body);
}

// createdUtc values newest first: newest, newest - 1, ...
inline std::vector<std::int64_t> descendingTimestamps(std::int64_t newest, std::size_t count) {
    std::vector<std::int64_t> values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(newest - static_cast<std::int64_t>(i));
    }
    return values;
}

inline domain::ArchiveReply reply(unsigned status, std::string body = {}) {
    domain::ArchiveReply r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

// In-memory archive answering search queries like the real endpoint:
// records with after < created_utc < before, newest first, at most limit.
// Scripted replies and transport faults queued per channel are served first.
class FakeArchive : public domain::IArchiveTransport {
public:
    using Scripted = std::function<domain::ArchiveReply(const domain::ArchiveQuery&)>;

    void addRecords(const std::string& channel, domain::ContentType type, const std::vector<std::int64_t>& utcs) {
        auto& stored = data_[{channel, type}];
        stored.insert(stored.end(), utcs.begin(), utcs.end());
    }

    void enqueue(const std::string& channel, Scripted scripted) { scripted_[channel].push_back(std::move(scripted)); }

    void enqueueStatus(const std::string& channel, unsigned status, std::size_t times = 1) {
        for (std::size_t i = 0; i < times; ++i) {
            enqueue(channel, [status](const domain::ArchiveQuery&) { return reply(status, "{}"); });
        }
    }

    void enqueueTransportError(const std::string& channel, const std::string& message) {
        enqueue(channel, [message](const domain::ArchiveQuery&) -> domain::ArchiveReply {
            throw std::runtime_error(message);
        });
    }

    // Every request for the channel gets this status.
    void alwaysStatus(const std::string& channel, unsigned status) { forced_[channel] = status; }

    domain::ArchiveReply search(const domain::ArchiveQuery& query) override {
        queries_.push_back(query);

        if (auto forced = forced_.find(query.channel); forced != forced_.end()) {
            return reply(forced->second, "{\"error\":\"forced\"}");
        }
        if (auto scripted = scripted_.find(query.channel); scripted != scripted_.end() && !scripted->second.empty()) {
            auto next = std::move(scripted->second.front());
            scripted->second.pop_front();
            return next(query);
        }

        std::vector<std::int64_t> matching;
        if (auto it = data_.find({query.channel, query.type}); it != data_.end()) {
            for (const auto utc : it->second) {
                if (utc > query.after && (!query.before.has_value() || utc < *query.before)) {
                    matching.push_back(utc);
                }
            }
        }
        std::sort(matching.begin(), matching.end(), std::greater<>());
        if (matching.size() > query.limit) {
            matching.resize(query.limit);
        }

        boost::json::array items;
        for (const auto utc : matching) {
            items.push_back(query.type == domain::ContentType::Posts ? postItem(query.channel, utc)
                                                                     : commentItem(query.channel, utc));
        }
        return reply(200U, pageBody(items));
    }

    const std::vector<domain::ArchiveQuery>& queries() const { return queries_; }

    std::size_t requestsFor(const std::string& channel) const {
        return static_cast<std::size_t>(std::count_if(queries_.begin(), queries_.end(), [&](const auto& query) {
            return query.channel == channel;
        }));
    }

    void clearQueries() { queries_.clear(); }

private:
    std::map<std::pair<std::string, domain::ContentType>, std::vector<std::int64_t>> data_;
    std::map<std::string, std::deque<Scripted>> scripted_;
    std::map<std::string, unsigned> forced_;
    std::vector<domain::ArchiveQuery> queries_;
};

// Lock table shared by the "processes" of a test. holdElsewhere() simulates
// another worker owning a path.
class FakeFileLock : public domain::IFileLock {
public:
    bool tryAcquire(const std::filesystem::path& path) override {
        const auto key = path.string();
        ++attempts_;
        if (held_.count(key) != 0 || elsewhere_.count(key) != 0) {
            return false;
        }
        held_.insert(key);
        return true;
    }

    void release(const std::filesystem::path& path) override { held_.erase(path.string()); }

    void holdElsewhere(const std::filesystem::path& path) { elsewhere_.insert(path.string()); }

    bool isHeld(const std::filesystem::path& path) const { return held_.count(path.string()) != 0; }
    std::size_t attempts() const { return attempts_; }

private:
    std::set<std::string> held_;
    std::set<std::string> elsewhere_;
    std::size_t attempts_{0};
};

// Steady clock driven by the test; sleeping through hooks advances it.
class FakeClock {
public:
    std::chrono::steady_clock::time_point now() const { return now_; }
    void advance(std::chrono::steady_clock::duration by) { now_ += by; }

    std::function<std::chrono::steady_clock::time_point()> nowFn() {
        return [this]() { return now_; };
    }

    std::function<void(std::chrono::milliseconds)> sleepFn() {
        return [this](std::chrono::milliseconds delay) {
            sleeps_.push_back(delay);
            now_ += delay;
        };
    }

    const std::vector<std::chrono::milliseconds>& sleeps() const { return sleeps_; }

private:
    std::chrono::steady_clock::time_point now_{std::chrono::hours(1000)};
    std::vector<std::chrono::milliseconds> sleeps_;
};

// Defaults for worker tests: no politeness delay, posts only, no retries.
inline chanarc::common::Config workerConfig(const std::filesystem::path& outputDir,
                                            std::vector<std::string> channels) {
    chanarc::common::Config config;
    config.outputDir = outputDir.string();
    config.channels = std::move(channels);
    config.contentTypes = {domain::ContentType::Posts};
    config.pageDelay = std::chrono::milliseconds(0);
    config.maxRetries = 0;
    return config;
}

// 2023-01-01T00:00:00Z, the default lower bound.
constexpr std::int64_t kDefaultAfter = 1'672'531'200;

}  // namespace testsupport
