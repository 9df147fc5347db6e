#include "app/OutputLayout.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace app {
namespace {

constexpr const char* kChunkMarker = ".chunk_";
constexpr const char* kParquetSuffix = ".parquet";

bool isSequenceNumber(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

}  // namespace

OutputLayout::OutputLayout(fs::path outputDir) : outputDir_(std::move(outputDir)) {}

std::string OutputLayout::prefix(const std::string& channel, domain::ContentType type) const {
    return channel + "_" + domain::contentTypeLabel(type);
}

fs::path OutputLayout::consolidated(const std::string& channel, domain::ContentType type) const {
    return outputDir_ / (prefix(channel, type) + kParquetSuffix);
}

fs::path OutputLayout::chunk(const std::string& channel, domain::ContentType type, std::uint64_t seq) const {
    std::ostringstream name;
    name << prefix(channel, type) << kChunkMarker << std::setw(4) << std::setfill('0') << seq << kParquetSuffix;
    return outputDir_ / name.str();
}

fs::path OutputLayout::existingAsChunk(const std::string& channel, domain::ContentType type) const {
    return outputDir_ / (prefix(channel, type) + kChunkMarker + "existing" + kParquetSuffix);
}

fs::path OutputLayout::cursor(const std::string& channel, domain::ContentType type) const {
    return outputDir_ / (prefix(channel, type) + ".cursor.json");
}

fs::path OutputLayout::lock(const std::string& channel) const {
    return outputDir_ / (channel + ".lock");
}

std::vector<fs::path> OutputLayout::listChunks(const std::string& channel, domain::ContentType type) const {
    const std::string head = prefix(channel, type) + kChunkMarker;
    const std::string tail = kParquetSuffix;

    std::vector<std::pair<std::uint64_t, fs::path>> numbered;
    std::error_code ec;
    for (fs::directory_iterator it(outputDir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (name.size() <= head.size() + tail.size() || name.rfind(head, 0) != 0 ||
            name.compare(name.size() - tail.size(), tail.size(), tail) != 0) {
            continue;
        }
        const auto seq = name.substr(head.size(), name.size() - head.size() - tail.size());
        if (!isSequenceNumber(seq)) {
            continue;
        }
        numbered.emplace_back(std::stoull(seq), it->path());
    }

    std::sort(numbered.begin(), numbered.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    std::vector<fs::path> chunks;
    chunks.reserve(numbered.size());
    for (auto& entry : numbered) {
        chunks.push_back(std::move(entry.second));
    }
    return chunks;
}

}  // namespace app
