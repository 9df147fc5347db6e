#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "adapters/arcticshift/ArcticShiftTransport.hpp"
#include "adapters/duckdb/DuckParquetStore.hpp"
#include "app/BackfillWorker.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "infra/fs/AtomicFileWriter.hpp"
#include "infra/fs/FlockFileLock.hpp"

namespace {

// Some channels failed; their state is in the dead-letter files.
constexpr int kExitPartialFailure = 2;

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        auto config = chanarc::common::Config::fromArgs(argc, argv);
        chanarc::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << chanarc::log::levelToString(config.logLevel));
        LOG_INFO("  Channels: " << joinList(config.channels));
        LOG_INFO("  Archive host: " << config.archiveHost << " timeout=" << config.httpTimeoutSec << "s");
        LOG_INFO("  Dead-letter dir: " << config.resolvedDeadLetterDir());
        LOG_INFO("  Limits: max_rows=" << config.maxRowsPerChannel << " chunk_size=" << config.chunkSize
                                       << " max_requests=" << config.maxTotalRequests
                                       << " max_duration=" << config.maxDuration.count() << "s"
                                       << " stale_days=" << config.staleDays);

        if (config.channels.empty()) {
            LOG_ERR("No channels configured (use --channels or CHANARC_CHANNELS)");
            return EXIT_FAILURE;
        }

        infra::http::RequestOptions requestOptions;
        requestOptions.timeout_sec = config.httpTimeoutSec;
        requestOptions.user_agent = config.userAgent;
        adapters::arcticshift::ArcticShiftTransport transport(config.archiveHost, requestOptions);

        infra::fs::FlockFileLock lock;
        infra::fs::AtomicFileWriter writer;
        adapters::duckdb::DuckParquetStore store(writer);

        app::BackfillWorker worker(config, app::BackfillWorker::Dependencies{transport, lock, writer, store});
        const auto stats = worker.run();

        if (stats.channelsFailed > 0) {
            LOG_WARN("Ingest finished with " << stats.channelsFailed << " failed channels");
            return kExitPartialFailure;
        }
        LOG_INFO("Ingest finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }
}
