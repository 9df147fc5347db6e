#include "infra/fs/AtomicFileWriter.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace infra::fs {
namespace {

namespace stdfs = std::filesystem;

std::runtime_error makeError(const stdfs::path& path, const std::string& message) {
    std::ostringstream oss;
    oss << "Atomic write of " << path.string() << " failed: " << message;
    return std::runtime_error(oss.str());
}

// fsync on the file (and its directory after the rename) so the rename is
// never observed before the content.
void syncPath(const stdfs::path& path, bool directory) {
    const int flags = directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY;
    const int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        if (directory) {
            return;
        }
        throw makeError(path, std::string{"open for fsync: "} + std::strerror(errno));
    }
    const int rc = ::fsync(fd);
    const int savedErrno = errno;
    ::close(fd);
    if (rc != 0 && !directory) {
        throw makeError(path, std::string{"fsync: "} + std::strerror(savedErrno));
    }
}

}  // namespace

std::optional<std::string> readFileIfExists(const stdfs::path& path) {
    std::error_code ec;
    if (!stdfs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Unable to open " + path.string() + ": " + std::strerror(errno));
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Read of " + path.string() + " failed");
    }
    return content.str();
}

void AtomicFileWriter::writeFile(const stdfs::path& dest, const std::string& content) {
    const auto staged = stagingPath(dest);
    {
        std::ofstream out(staged, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw makeError(dest, "unable to open staging file " + staged.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            stdfs::remove(staged, ignored);
            throw makeError(dest, "short write to staging file " + staged.string());
        }
    }
    commit(staged, dest);
}

void AtomicFileWriter::commit(const stdfs::path& staged, const stdfs::path& dest) {
    syncPath(staged, false);

    std::error_code ec;
    stdfs::rename(staged, dest, ec);
    if (ec) {
        const auto reason = ec.message();
        std::error_code ignored;
        stdfs::remove(staged, ignored);
        throw makeError(dest, "rename from " + staged.string() + ": " + reason);
    }

    if (dest.has_parent_path()) {
        syncPath(dest.parent_path(), true);
    }
}

}  // namespace infra::fs
