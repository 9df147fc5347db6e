#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "domain/Records.hpp"

namespace domain {

struct ArchiveQuery {
    std::string channel;
    ContentType type{ContentType::Posts};
    std::int64_t after{0};
    std::optional<std::int64_t> before;
    std::size_t limit{100};
};

struct ArchiveReply {
    unsigned status = 0U;
    std::string body;
};

// Raw access to the archive search endpoint. Implementations throw
// std::runtime_error on transport faults (DNS, connect, TLS, read timeout);
// any HTTP status, including errors, is returned as a reply.
class IArchiveTransport {
public:
    virtual ~IArchiveTransport() = default;

    virtual ArchiveReply search(const ArchiveQuery& query) = 0;
};

// Exclusive, non-blocking, per-path lock shared between processes.
class IFileLock {
public:
    virtual ~IFileLock() = default;

    virtual bool tryAcquire(const std::filesystem::path& path) = 0;
    virtual void release(const std::filesystem::path& path) = 0;
};

// Every durable artifact goes through write-to-staging then rename, so a
// reader sees either the previous file or the complete new one.
class IAtomicWriter {
public:
    virtual ~IAtomicWriter() = default;

    virtual void writeFile(const std::filesystem::path& dest, const std::string& content) = 0;

    // Publishes a file produced elsewhere (e.g. by the columnar engine).
    virtual void commit(const std::filesystem::path& staged, const std::filesystem::path& dest) = 0;

    virtual std::filesystem::path stagingPath(const std::filesystem::path& dest) const {
        auto staged = dest;
        staged += ".tmp";
        return staged;
    }
};

// Columnar (Parquet) persistence of typed records.
class IRecordFileStore {
public:
    virtual ~IRecordFileStore() = default;

    // Writes atomically; returns the size in bytes of the published file.
    virtual std::uint64_t writeRecords(ContentType type,
                                       const std::vector<Record>& records,
                                       const std::filesystem::path& dest) = 0;

    // Concatenates inputs in the given order into dest; returns the number of
    // rows written. Not atomic: callers pass a staging path and publish it
    // with IAtomicWriter::commit. Inputs are left untouched.
    virtual std::uint64_t merge(ContentType type,
                                const std::vector<std::filesystem::path>& inputs,
                                const std::filesystem::path& dest) = 0;

    virtual std::optional<std::int64_t> minCreatedUtc(const std::filesystem::path& file) = 0;
    virtual std::uint64_t countRows(const std::filesystem::path& file) = 0;
};

}  // namespace domain
