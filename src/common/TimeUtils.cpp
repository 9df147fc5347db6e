#include "common/TimeUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace chanarc::common::time {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

}  // namespace

std::optional<std::int64_t> parseDateToSeconds(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream input(value);
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail()) {
        return std::nullopt;
    }
    char trailing = 0;
    if (input >> trailing) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    if (raw < 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(raw);
}

std::string toIsoUtc(std::chrono::system_clock::time_point tp) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &raw);
#else
    gmtime_r(&raw, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "+00:00";
    return out.str();
}

std::string nowIsoUtc() {
    return toIsoUtc(std::chrono::system_clock::now());
}

}  // namespace chanarc::common::time
