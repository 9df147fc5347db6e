#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace chanarc::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace chanarc::log

#define CHANARC_LOG_IMPL(level, expr)                                                      \
    do {                                                                                   \
        if (::chanarc::log::shouldLog(level)) {                                            \
            std::ostringstream chanarc_log_stream__;                                       \
            chanarc_log_stream__ << expr;                                                  \
            ::chanarc::log::log(level, chanarc_log_stream__.str());                        \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) CHANARC_LOG_IMPL(::chanarc::log::Level::Debug, expr)
#define LOG_INFO(expr) CHANARC_LOG_IMPL(::chanarc::log::Level::Info, expr)
#define LOG_WARN(expr) CHANARC_LOG_IMPL(::chanarc::log::Level::Warn, expr)
#define LOG_ERR(expr) CHANARC_LOG_IMPL(::chanarc::log::Level::Error, expr)
