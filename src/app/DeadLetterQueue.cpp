#include "app/DeadLetterQueue.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "common/TimeUtils.hpp"
#include "infra/fs/AtomicFileWriter.hpp"

namespace fs = std::filesystem;

namespace app {
namespace {

boost::json::object toJson(const DeadLetterEntry& entry) {
    boost::json::object object;
    object["channel"] = entry.channel;
    object["content_type"] = entry.contentType;
    object["reason"] = entry.reason;
    if (entry.oldestUtcSeen.has_value()) {
        object["oldest_utc_seen"] = *entry.oldestUtcSeen;
    } else {
        object["oldest_utc_seen"] = nullptr;
    }
    object["rows_downloaded"] = entry.rowsDownloaded;
    object["attempts"] = entry.attempts;
    object["first_failed_at"] = entry.firstFailedAt;
    object["last_failed_at"] = entry.lastFailedAt;
    return object;
}

std::string textOf(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    return value != nullptr && value->is_string() ? std::string{value->get_string()} : std::string{};
}

std::optional<DeadLetterEntry> fromJson(const boost::json::object& object) {
    DeadLetterEntry entry;
    entry.channel = textOf(object, "channel");
    if (entry.channel.empty()) {
        return std::nullopt;
    }
    entry.contentType = textOf(object, "content_type");
    entry.reason = textOf(object, "reason");
    if (const auto* oldest = object.if_contains("oldest_utc_seen"); oldest != nullptr) {
        if (const auto* i = oldest->if_int64()) {
            entry.oldestUtcSeen = *i;
        }
    }
    if (const auto* rows = object.if_contains("rows_downloaded"); rows != nullptr) {
        if (const auto* u = rows->if_uint64()) {
            entry.rowsDownloaded = *u;
        } else if (const auto* i = rows->if_int64(); i != nullptr && *i > 0) {
            entry.rowsDownloaded = static_cast<std::uint64_t>(*i);
        }
    }
    if (const auto* attempts = object.if_contains("attempts"); attempts != nullptr) {
        if (const auto* i = attempts->if_int64()) {
            entry.attempts = static_cast<int>(*i);
        } else if (const auto* u = attempts->if_uint64()) {
            entry.attempts = static_cast<int>(*u);
        }
    }
    entry.firstFailedAt = textOf(object, "first_failed_at");
    entry.lastFailedAt = textOf(object, "last_failed_at");
    return entry;
}

}  // namespace

DeadLetterQueue::DeadLetterQueue(fs::path directory, domain::IAtomicWriter& writer, int maxAttempts, NowFn now)
    : directory_(std::move(directory)),
      writer_(writer),
      maxAttempts_(maxAttempts),
      now_(now ? std::move(now) : NowFn{[] { return chanarc::common::time::nowIsoUtc(); }}) {}

fs::path DeadLetterQueue::transientPath(const std::string& channel) const {
    return directory_ / (channel + ".jsonl");
}

fs::path DeadLetterQueue::permanentPath(const std::string& channel) const {
    return directory_ / (channel + "_permanent.jsonl");
}

DeadLetterQueue::FailureOutcome DeadLetterQueue::recordFailure(const std::string& channel,
                                                               const std::string& reason,
                                                               std::optional<std::int64_t> oldestUtcSeen,
                                                               std::uint64_t rowsDownloaded) {
    const auto path = transientPath(channel);
    auto entries = readEntries_(path);
    const auto now = now_();

    auto it = std::find_if(entries.begin(), entries.end(), [&](const DeadLetterEntry& entry) {
        return entry.channel == channel;
    });
    if (it == entries.end()) {
        DeadLetterEntry entry;
        entry.channel = channel;
        entry.firstFailedAt = now;
        entries.push_back(std::move(entry));
        it = std::prev(entries.end());
    }
    ++it->attempts;
    it->reason = reason;
    it->oldestUtcSeen = oldestUtcSeen;
    it->rowsDownloaded = rowsDownloaded;
    it->lastFailedAt = now;

    FailureOutcome outcome;
    outcome.attempts = it->attempts;

    if (maxAttempts_ > 0 && it->attempts >= maxAttempts_) {
        const auto permanentFile = permanentPath(channel);
        auto permanentEntries = readEntries_(permanentFile);
        permanentEntries.push_back(*it);
        writeEntries_(permanentFile, permanentEntries);
        entries.erase(it);
        outcome.promoted = true;
        LOG_WARN("DeadLetterQueue: channel " << channel << " reached " << maxAttempts_
                                             << " attempts, moved to " << permanentFile.string());
    }

    writeEntries_(path, entries);
    return outcome;
}

bool DeadLetterQueue::clear(const std::string& channel) {
    const auto path = transientPath(channel);
    auto entries = readEntries_(path);
    const auto before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const DeadLetterEntry& entry) { return entry.channel == channel; }),
                  entries.end());
    if (entries.size() == before) {
        return false;
    }
    writeEntries_(path, entries);
    LOG_INFO("DeadLetterQueue: cleared entry for " << channel);
    return true;
}

std::vector<DeadLetterEntry> DeadLetterQueue::pending(const std::string& channel) const {
    return readEntries_(transientPath(channel));
}

std::vector<DeadLetterEntry> DeadLetterQueue::permanent(const std::string& channel) const {
    return readEntries_(permanentPath(channel));
}

std::vector<DeadLetterEntry> DeadLetterQueue::readEntries_(const fs::path& path) const {
    std::vector<DeadLetterEntry> entries;
    const auto content = infra::fs::readFileIfExists(path);
    if (!content.has_value()) {
        return entries;
    }

    std::istringstream lines(*content);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(lines, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        boost::json::error_code ec;
        auto parsed = boost::json::parse(line, ec);
        std::optional<DeadLetterEntry> entry;
        if (!ec && parsed.is_object()) {
            entry = fromJson(parsed.as_object());
        }
        if (!entry.has_value()) {
            LOG_WARN("DeadLetterQueue: skipping corrupt line " << lineNumber << " in " << path.string());
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

void DeadLetterQueue::writeEntries_(const fs::path& path, const std::vector<DeadLetterEntry>& entries) {
    if (entries.empty()) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            throw std::runtime_error("Unable to remove " + path.string() + ": " + ec.message());
        }
        return;
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Unable to create dead-letter directory (" + directory_.string() +
                                 "): " + ec.message());
    }

    std::string content;
    for (const auto& entry : entries) {
        content += boost::json::serialize(toJson(entry));
        content += '\n';
    }
    writer_.writeFile(path, content);
}

}  // namespace app
