/**
 * @file logger.cpp
 */
#include "jobtmpl/common/logger.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace jobtmpl
{

namespace
{

LogLevel g_level = LogLevel::Info;
bool g_level_initialized = false;
std::mutex g_log_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

LogLevel level_from_env() noexcept
{
    const char* env_val = std::getenv("JOBTMPL_LOG_LEVEL");
    if (env_val == nullptr)
    {
        return LogLevel::Info;
    }
    return Logger::parse_level(env_val);
}

} // namespace

void Logger::set_level(LogLevel level) noexcept
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized)
    {
        g_level = level_from_env();
        g_level_initialized = true;
    }
    return g_level;
}

LogLevel Logger::parse_level(const std::string& text) noexcept
{
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "error") return LogLevel::Error;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "trace") return LogLevel::Trace;
    return LogLevel::Info;
}

void Logger::log(LogLevel level, const std::string& message) noexcept
{
    try
    {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level()))
        {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::time_t now_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&now_t, &local_tm);

        std::lock_guard<std::mutex> lock(g_log_mutex);

        std::ostringstream ss;
        ss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << level_to_string(level) << "]";

        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end())
        {
            ss << " [" << it->second << "]";
        }
        else
        {
            ss << " [T" << std::this_thread::get_id() << "]";
        }
        ss << " " << message;

        std::cerr << ss.str() << std::endl;
    }
    catch (const std::exception&)
    {
        // Never throw from logging
    }
}

const char* Logger::level_to_string(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Trace: return "TRACE";
    }
    return "UNKN ";
}

void set_thread_name(const std::string& name)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

} // namespace jobtmpl
