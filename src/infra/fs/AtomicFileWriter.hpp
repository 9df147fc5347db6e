#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "domain/Ports.hpp"

namespace infra::fs {

class AtomicFileWriter : public domain::IAtomicWriter {
public:
    AtomicFileWriter() = default;
    ~AtomicFileWriter() override = default;

    void writeFile(const std::filesystem::path& dest, const std::string& content) override;
    void commit(const std::filesystem::path& staged, const std::filesystem::path& dest) override;
};

// Whole-file read; nullopt when the file does not exist. Throws
// std::runtime_error when an existing file cannot be read.
std::optional<std::string> readFileIfExists(const std::filesystem::path& path);

}  // namespace infra::fs
