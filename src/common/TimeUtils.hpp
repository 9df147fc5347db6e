#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace chanarc::common::time {

constexpr std::int64_t kSecondsPerDay = 86'400;

// Parses "YYYY-MM-DD" as midnight UTC.
std::optional<std::int64_t> parseDateToSeconds(const std::string& value);

// ISO-8601 with seconds precision and a "+00:00" suffix.
std::string toIsoUtc(std::chrono::system_clock::time_point tp);

std::string nowIsoUtc();

}  // namespace chanarc::common::time
