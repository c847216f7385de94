/**
 * @file logger.hpp
 * @brief Process-wide leveled logger writing to stderr.
 */
#pragma once
#include "jobtmpl/common/common.hpp"

namespace jobtmpl
{

enum class LogLevel : uint8_t
{
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

/**
 * @brief Static logger shared by every Session and executor thread.
 *
 * @details
 * The threshold defaults to Info. Until `set_level()` is called it is read
 * once from the `JOBTMPL_LOG_LEVEL` environment variable
 * (`error`, `warn`, `info`, `debug`, `trace`; case-insensitive).
 * Lines go to stderr so stdout stays free for driver output.
 *
 * @par Thread safety
 * - All methods are safe to call concurrently.
 * - Logging never throws.
 */
class Logger
{
public:
    static void set_level(LogLevel level) noexcept;
    static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::Error, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::Warn, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::Info, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::Trace, msg); }

    /**
     * @brief Parse a level name; unknown names yield Info.
     */
    static LogLevel parse_level(const std::string& text) noexcept;

private:
    static const char* level_to_string(LogLevel level) noexcept;
};

/**
 * @brief Name the calling thread in subsequent log lines.
 */
void set_thread_name(const std::string& name);

} // namespace jobtmpl

#define JOBTMPL_LOG_ERROR(msg) ::jobtmpl::Logger::error(msg)
#define JOBTMPL_LOG_WARN(msg)  ::jobtmpl::Logger::warn(msg)
#define JOBTMPL_LOG_INFO(msg)  ::jobtmpl::Logger::info(msg)
#define JOBTMPL_LOG_DEBUG(msg) ::jobtmpl::Logger::debug(msg)
#define JOBTMPL_LOG_TRACE(msg) ::jobtmpl::Logger::trace(msg)
