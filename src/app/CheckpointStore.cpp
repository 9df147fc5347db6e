#include "app/CheckpointStore.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "infra/fs/AtomicFileWriter.hpp"

namespace app {
namespace {

std::optional<std::uint64_t> uintField(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr) {
        return std::uint64_t{0};
    }
    if (const auto* u = value->if_uint64()) {
        return *u;
    }
    if (const auto* i = value->if_int64()) {
        if (*i < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(*i);
    }
    return std::nullopt;
}

std::string stringField(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return {};
    }
    return std::string{value->get_string()};
}

}  // namespace

CheckpointStore::CheckpointStore(const OutputLayout& layout, domain::IAtomicWriter& writer)
    : layout_(layout), writer_(writer) {}

std::optional<Checkpoint> CheckpointStore::load(const std::string& channel, domain::ContentType type) const {
    const auto path = layout_.cursor(channel, type);

    std::optional<std::string> text;
    try {
        text = infra::fs::readFileIfExists(path);
    } catch (const std::exception& ex) {
        LOG_WARN("CheckpointStore: ignoring unreadable cursor " << path.string() << " error=" << ex.what());
        return std::nullopt;
    }
    if (!text.has_value()) {
        return std::nullopt;
    }

    auto checkpoint = fromJson(*text);
    if (!checkpoint.has_value()) {
        LOG_WARN("CheckpointStore: ignoring corrupt cursor " << path.string());
        return std::nullopt;
    }
    if (checkpoint->channel != channel || checkpoint->type != type) {
        LOG_WARN("CheckpointStore: cursor " << path.string() << " belongs to " << checkpoint->channel << '/'
                                            << domain::contentTypeLabel(checkpoint->type) << ", ignoring");
        return std::nullopt;
    }
    return checkpoint;
}

void CheckpointStore::save(const Checkpoint& checkpoint) {
    writer_.writeFile(layout_.cursor(checkpoint.channel, checkpoint.type), toJson(checkpoint));
}

void CheckpointStore::remove(const std::string& channel, domain::ContentType type) {
    const auto path = layout_.cursor(channel, type);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw std::system_error(ec, "Unable to remove cursor " + path.string());
    }
}

std::string CheckpointStore::toJson(const Checkpoint& checkpoint) {
    boost::json::object object;
    object["channel"] = checkpoint.channel;
    object["content_type"] = domain::contentTypeLabel(checkpoint.type);
    if (checkpoint.oldestUtcSeen.has_value()) {
        object["oldest_utc_seen"] = *checkpoint.oldestUtcSeen;
    } else {
        object["oldest_utc_seen"] = nullptr;
    }
    object["rows_flushed"] = checkpoint.rowsFlushed;
    object["chunks_written"] = checkpoint.chunksWritten;
    object["pages_completed"] = checkpoint.pagesCompleted;
    object["started_at"] = checkpoint.startedAt;
    object["updated_at"] = checkpoint.updatedAt;
    object["merge_pending"] = checkpoint.mergePending;
    return boost::json::serialize(object);
}

std::optional<Checkpoint> CheckpointStore::fromJson(const std::string& text) {
    boost::json::error_code ec;
    auto parsed = boost::json::parse(text, ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }
    const auto& object = parsed.as_object();

    Checkpoint checkpoint;
    checkpoint.channel = stringField(object, "channel");
    const auto type = domain::contentTypeFromString(stringField(object, "content_type"));
    if (checkpoint.channel.empty() || !type.has_value()) {
        return std::nullopt;
    }
    checkpoint.type = *type;

    if (const auto* oldest = object.if_contains("oldest_utc_seen"); oldest != nullptr && !oldest->is_null()) {
        if (const auto* i = oldest->if_int64()) {
            checkpoint.oldestUtcSeen = *i;
        } else if (const auto* u = oldest->if_uint64()) {
            checkpoint.oldestUtcSeen = static_cast<std::int64_t>(*u);
        } else {
            return std::nullopt;
        }
    }

    const auto rows = uintField(object, "rows_flushed");
    const auto chunks = uintField(object, "chunks_written");
    const auto pages = uintField(object, "pages_completed");
    if (!rows || !chunks || !pages) {
        return std::nullopt;
    }
    checkpoint.rowsFlushed = *rows;
    checkpoint.chunksWritten = *chunks;
    checkpoint.pagesCompleted = *pages;
    checkpoint.startedAt = stringField(object, "started_at");
    checkpoint.updatedAt = stringField(object, "updated_at");

    if (const auto* pending = object.if_contains("merge_pending"); pending != nullptr && pending->is_bool()) {
        checkpoint.mergePending = pending->get_bool();
    }
    return checkpoint;
}

}  // namespace app
