#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "common/TimeUtils.hpp"

namespace chanarc::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::size_t parseSize(const std::string& value, const std::string& label) {
    try {
        if (!value.empty() && value.front() == '-') {
            throw std::out_of_range("negative");
        }
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parsePositiveSize(const std::string& value, const std::string& label) {
    const auto parsed = parseSize(value, label);
    if (parsed == 0U) {
        throw std::runtime_error("Invalid value for " + label + ": " + value + " (must be >= 1)");
    }
    return parsed;
}

int parseNonNegativeInt(const std::string& value, const std::string& label) {
    const auto parsed = parseSize(value, label);
    if (parsed > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<int>(parsed);
}

std::vector<domain::ContentType> parseContentTypes(const std::string& value) {
    std::vector<domain::ContentType> types;
    for (const auto& item : parseCsvList(toLower(value))) {
        const auto type = domain::contentTypeFromString(item);
        if (!type.has_value()) {
            throw std::runtime_error("Unknown content type: " + item);
        }
        if (std::find(types.begin(), types.end(), *type) == types.end()) {
            types.push_back(*type);
        }
    }
    if (types.empty()) {
        throw std::runtime_error("At least one content type is required");
    }
    return types;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string Config::resolvedDeadLetterDir() const {
    if (!deadLetterDir.empty()) {
        return deadLetterDir;
    }
    return (std::filesystem::path{outputDir} / "dead_letter").string();
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = chanarc::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envOutput = std::getenv("CHANARC_OUTPUT_DIR")) {
        auto pathValue = trim(envOutput);
        if (!pathValue.empty()) {
            config.outputDir = std::move(pathValue);
        }
    }
    if (const char* envDeadLetter = std::getenv("CHANARC_DEAD_LETTER_DIR")) {
        config.deadLetterDir = trim(envDeadLetter);
    }
    if (const char* envHost = std::getenv("CHANARC_ARCHIVE_HOST")) {
        auto hostValue = trim(envHost);
        if (!hostValue.empty()) {
            config.archiveHost = std::move(hostValue);
        }
    }
    if (const char* envChannels = std::getenv("CHANARC_CHANNELS")) {
        config.channels = parseCsvList(envChannels);
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = chanarc::log::levelFromString(toLower(levelArg));
    }
    if (auto outputArg = valueFromArgs(argc, argv, "--output-dir"); !outputArg.empty()) {
        config.outputDir = trim(outputArg);
    }
    if (auto deadLetterArg = valueFromArgs(argc, argv, "--dead-letter-dir"); !deadLetterArg.empty()) {
        config.deadLetterDir = trim(deadLetterArg);
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--host"); !hostArg.empty()) {
        config.archiveHost = trim(hostArg);
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--http-timeout"); !timeoutArg.empty()) {
        config.httpTimeoutSec = static_cast<int>(parsePositiveSize(timeoutArg, "--http-timeout"));
    }
    if (auto channelsArg = valueFromArgs(argc, argv, "--channels"); !channelsArg.empty()) {
        config.channels = parseCsvList(channelsArg);
    }
    if (auto typesArg = valueFromArgs(argc, argv, "--types"); !typesArg.empty()) {
        config.contentTypes = parseContentTypes(typesArg);
    }
    if (hasFlag(argc, argv, "--posts-only")) {
        config.contentTypes = {domain::ContentType::Posts};
    }
    if (hasFlag(argc, argv, "--comments-only")) {
        config.contentTypes = {domain::ContentType::Comments};
    }
    if (auto afterArg = valueFromArgs(argc, argv, "--after"); !afterArg.empty()) {
        config.after = trim(afterArg);
    }
    if (auto maxRowsArg = valueFromArgs(argc, argv, "--max-rows"); !maxRowsArg.empty()) {
        config.maxRowsPerChannel = parsePositiveSize(maxRowsArg, "--max-rows");
    }
    if (auto chunkArg = valueFromArgs(argc, argv, "--chunk-size"); !chunkArg.empty()) {
        config.chunkSize = parsePositiveSize(chunkArg, "--chunk-size");
    }
    if (auto bufferArg = valueFromArgs(argc, argv, "--max-buffer-bytes"); !bufferArg.empty()) {
        config.maxBufferBytes = parsePositiveSize(bufferArg, "--max-buffer-bytes");
    }
    if (auto retriesArg = valueFromArgs(argc, argv, "--max-retries"); !retriesArg.empty()) {
        config.maxRetries = parseNonNegativeInt(retriesArg, "--max-retries");
    }
    if (auto breakerArg = valueFromArgs(argc, argv, "--breaker-threshold"); !breakerArg.empty()) {
        config.circuitBreakerThreshold = parseNonNegativeInt(breakerArg, "--breaker-threshold");
    }
    if (auto requestsArg = valueFromArgs(argc, argv, "--max-requests"); !requestsArg.empty()) {
        config.maxTotalRequests = parsePositiveSize(requestsArg, "--max-requests");
    }
    if (auto durationArg = valueFromArgs(argc, argv, "--max-duration"); !durationArg.empty()) {
        config.maxDuration = std::chrono::seconds(parsePositiveSize(durationArg, "--max-duration"));
    }
    if (auto staleArg = valueFromArgs(argc, argv, "--stale-days"); !staleArg.empty()) {
        config.staleDays = parseNonNegativeInt(staleArg, "--stale-days");
    }
    if (auto delayArg = valueFromArgs(argc, argv, "--page-delay-ms"); !delayArg.empty()) {
        config.pageDelay = std::chrono::milliseconds(parseSize(delayArg, "--page-delay-ms"));
    }

    if (!time::parseDateToSeconds(config.after).has_value()) {
        LOG_WARN("Invalid --after '" << config.after << "', falling back to 2023-01-01");
        config.after = "2023-01-01";
    }

    if (config.outputDir.empty()) {
        throw std::runtime_error("Output directory must not be empty");
    }
    std::error_code ec;
    std::filesystem::create_directories(config.outputDir, ec);
    if (ec) {
        throw std::runtime_error("Unable to create output directory (" + config.outputDir + "): " + ec.message());
    }

    LOG_INFO("Output directory: " << config.outputDir);

    return config;
}

}  // namespace chanarc::common
