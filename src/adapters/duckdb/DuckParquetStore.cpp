#include "adapters/duckdb/DuckParquetStore.hpp"

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr auto kStagingTable = "staging_rows";

constexpr auto kPostColumns =
    "id, subreddit, title, selftext, score, created_utc, permalink, upvote_ratio, num_comments";
constexpr auto kCommentColumns = "id, subreddit, body, score, created_utc, permalink, link_id, parent_id";

constexpr auto kPostTableDdl = R"SQL(
    CREATE OR REPLACE TEMP TABLE staging_rows (
        id VARCHAR,
        subreddit VARCHAR,
        title VARCHAR,
        selftext VARCHAR,
        score BIGINT,
        created_utc BIGINT,
        permalink VARCHAR,
        upvote_ratio DOUBLE,
        num_comments BIGINT
    )
)SQL";

constexpr auto kCommentTableDdl = R"SQL(
    CREATE OR REPLACE TEMP TABLE staging_rows (
        id VARCHAR,
        subreddit VARCHAR,
        body VARCHAR,
        score BIGINT,
        created_utc BIGINT,
        permalink VARCHAR,
        link_id VARCHAR,
        parent_id VARCHAR
    )
)SQL";

const char* columnsFor(domain::ContentType type) {
    return type == domain::ContentType::Posts ? kPostColumns : kCommentColumns;
}

// SQL string literal with embedded quotes doubled.
std::string quoted(const fs::path& path) {
    const auto raw = path.string();
    std::string literal;
    literal.reserve(raw.size() + 2);
    literal.push_back('\'');
    for (const char ch : raw) {
        if (ch == '\'') {
            literal.push_back('\'');
        }
        literal.push_back(ch);
    }
    literal.push_back('\'');
    return literal;
}

std::string textOf(const ::duckdb::Value& value) {
    return value.IsNull() ? std::string{} : value.GetValue<std::string>();
}

std::int64_t int64Of(const ::duckdb::Value& value) {
    return value.IsNull() ? 0 : value.GetValue<std::int64_t>();
}

double doubleOf(const ::duckdb::Value& value) {
    return value.IsNull() ? 0.0 : value.GetValue<double>();
}

void appendRecord(::duckdb::Appender& appender, const domain::Record& record) {
    appender.BeginRow();
    if (const auto* post = std::get_if<domain::PostRecord>(&record)) {
        appender.Append(::duckdb::Value(post->id));
        appender.Append(::duckdb::Value(post->channel));
        appender.Append(::duckdb::Value(post->title));
        appender.Append(::duckdb::Value(post->body));
        appender.Append(::duckdb::Value::BIGINT(post->score));
        appender.Append(::duckdb::Value::BIGINT(post->createdUtc));
        appender.Append(::duckdb::Value(post->permalink));
        appender.Append(::duckdb::Value::DOUBLE(post->qualityRatio));
        appender.Append(::duckdb::Value::BIGINT(post->replyCount));
    } else {
        const auto& comment = std::get<domain::CommentRecord>(record);
        appender.Append(::duckdb::Value(comment.id));
        appender.Append(::duckdb::Value(comment.channel));
        appender.Append(::duckdb::Value(comment.body));
        appender.Append(::duckdb::Value::BIGINT(comment.score));
        appender.Append(::duckdb::Value::BIGINT(comment.createdUtc));
        appender.Append(::duckdb::Value(comment.permalink));
        appender.Append(::duckdb::Value(comment.linkId));
        appender.Append(::duckdb::Value(comment.parentId));
    }
    appender.EndRow();
}

std::unique_ptr<::duckdb::QueryResult> queryOrThrow(::duckdb::Connection& connection,
                                                    const std::string& sql,
                                                    const char* context) {
    auto result = connection.Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown error"};
        throw std::runtime_error(std::string{"DuckParquetStore: "} + context + " failed: " + errorMessage);
    }
    return result;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

}  // namespace

DuckParquetStore::DuckParquetStore(domain::IAtomicWriter& writer)
    : writer_(writer),
      database_(std::make_unique<::duckdb::DuckDB>(nullptr)),
      connection_(std::make_unique<::duckdb::Connection>(*database_)) {}

DuckParquetStore::~DuckParquetStore() = default;

void DuckParquetStore::execute_(const std::string& sql, const char* context) {
    queryOrThrow(*connection_, sql, context);
}

std::uint64_t DuckParquetStore::writeRecords(domain::ContentType type,
                                             const std::vector<domain::Record>& records,
                                             const fs::path& dest) {
    std::lock_guard<std::mutex> lock(mutex_);

    execute_(type == domain::ContentType::Posts ? kPostTableDdl : kCommentTableDdl, "create staging table");
    {
        ::duckdb::Appender appender(*connection_, kStagingTable);
        for (const auto& record : records) {
            appendRecord(appender, record);
        }
        appender.Close();
    }

    const auto staged = writer_.stagingPath(dest);
    removeQuietly(staged);
    try {
        execute_(std::string{"COPY "} + kStagingTable + " TO " + quoted(staged) + " (FORMAT PARQUET)",
                 "chunk copy");
        writer_.commit(staged, dest);
    } catch (...) {
        removeQuietly(staged);
        throw;
    }
    execute_(std::string{"DROP TABLE IF EXISTS "} + kStagingTable, "drop staging table");

    std::error_code ec;
    const auto size = fs::file_size(dest, ec);
    return ec ? 0U : static_cast<std::uint64_t>(size);
}

std::uint64_t DuckParquetStore::merge(domain::ContentType type,
                                      const std::vector<fs::path>& inputs,
                                      const fs::path& dest) {
    if (inputs.empty()) {
        return 0U;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string columns = columnsFor(type);

    // Each input is tagged with its position and physical row number so the
    // output keeps input order, then row order within each input.
    std::ostringstream select;
    select << "SELECT " << columns << " FROM (";
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            select << " UNION ALL ";
        }
        select << "SELECT " << i << " AS merge_ord, file_row_number AS merge_row, " << columns
               << " FROM read_parquet(" << quoted(inputs[i]) << ", file_row_number = true)";
    }
    select << ") ORDER BY merge_ord, merge_row";

    removeQuietly(dest);
    try {
        execute_("COPY (" + select.str() + ") TO " + quoted(dest) + " (FORMAT PARQUET)", "merge copy");
        return countRowsUnlocked_(dest);
    } catch (...) {
        removeQuietly(dest);
        throw;
    }
}

std::uint64_t DuckParquetStore::countRowsUnlocked_(const fs::path& file) {
    auto result = queryOrThrow(*connection_, "SELECT COUNT(*) FROM read_parquet(" + quoted(file) + ")", "row count");
    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0) {
        return 0U;
    }
    return static_cast<std::uint64_t>(int64Of(chunk->GetValue(0, 0)));
}

std::optional<std::int64_t> DuckParquetStore::minCreatedUtc(const fs::path& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = queryOrThrow(*connection_,
                               "SELECT MIN(created_utc) FROM read_parquet(" + quoted(file) + ")",
                               "min created_utc");
    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0) {
        return std::nullopt;
    }
    const auto value = chunk->GetValue(0, 0);
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<std::int64_t>();
}

std::uint64_t DuckParquetStore::countRows(const fs::path& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    return countRowsUnlocked_(file);
}

std::vector<domain::Record> DuckParquetStore::readRecords(domain::ContentType type, const fs::path& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string{"SELECT "} + columnsFor(type) + " FROM read_parquet(" + quoted(file) +
                            ", file_row_number = true) ORDER BY file_row_number";
    auto result = queryOrThrow(*connection_, sql, "read records");

    std::vector<domain::Record> records;
    while (auto chunk = result->Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            if (type == domain::ContentType::Posts) {
                domain::PostRecord post;
                post.id = textOf(chunk->GetValue(0, row));
                post.channel = textOf(chunk->GetValue(1, row));
                post.title = textOf(chunk->GetValue(2, row));
                post.body = textOf(chunk->GetValue(3, row));
                post.score = int64Of(chunk->GetValue(4, row));
                post.createdUtc = int64Of(chunk->GetValue(5, row));
                post.permalink = textOf(chunk->GetValue(6, row));
                post.qualityRatio = doubleOf(chunk->GetValue(7, row));
                post.replyCount = int64Of(chunk->GetValue(8, row));
                records.emplace_back(std::move(post));
            } else {
                domain::CommentRecord comment;
                comment.id = textOf(chunk->GetValue(0, row));
                comment.channel = textOf(chunk->GetValue(1, row));
                comment.body = textOf(chunk->GetValue(2, row));
                comment.score = int64Of(chunk->GetValue(3, row));
                comment.createdUtc = int64Of(chunk->GetValue(4, row));
                comment.permalink = textOf(chunk->GetValue(5, row));
                comment.linkId = textOf(chunk->GetValue(6, row));
                comment.parentId = textOf(chunk->GetValue(7, row));
                records.emplace_back(std::move(comment));
            }
        }
    }
    return records;
}

}  // namespace adapters::duckdb
