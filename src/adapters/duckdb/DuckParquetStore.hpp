#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Parquet files written and read through an in-process, in-memory DuckDB
// instance. Chunks are published through the supplied atomic writer; merge
// output stays at the given path for the caller to publish.
class DuckParquetStore : public domain::IRecordFileStore {
public:
    explicit DuckParquetStore(domain::IAtomicWriter& writer);
    ~DuckParquetStore() override;

    DuckParquetStore(const DuckParquetStore&) = delete;
    DuckParquetStore& operator=(const DuckParquetStore&) = delete;

    std::uint64_t writeRecords(domain::ContentType type,
                               const std::vector<domain::Record>& records,
                               const std::filesystem::path& dest) override;

    std::uint64_t merge(domain::ContentType type,
                        const std::vector<std::filesystem::path>& inputs,
                        const std::filesystem::path& dest) override;

    std::optional<std::int64_t> minCreatedUtc(const std::filesystem::path& file) override;
    std::uint64_t countRows(const std::filesystem::path& file) override;

    // Rows of a file in stored order.
    std::vector<domain::Record> readRecords(domain::ContentType type, const std::filesystem::path& file);

private:
    void execute_(const std::string& sql, const char* context);
    std::uint64_t countRowsUnlocked_(const std::filesystem::path& file);

    domain::IAtomicWriter& writer_;
    std::mutex mutex_;
    std::unique_ptr<::duckdb::DuckDB> database_;
    std::unique_ptr<::duckdb::Connection> connection_;
};

}  // namespace adapters::duckdb
