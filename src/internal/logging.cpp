#include "logging.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>

namespace mcpmgr
{
namespace internal
{

namespace
{
// Keeps lines from different threads from interleaving on std::cerr
std::mutex& stderr_mutex()
{
    static std::mutex mutex;
    return mutex;
}

const char* level_label(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "Debug";
    case LogLevel::Info:
        return "Info";
    case LogLevel::Warning:
        return "Warning";
    case LogLevel::Error:
        return "Error";
    }
    return "Log";
}
} // namespace

LogLevel log_level_from_env()
{
    const char* env = std::getenv("MCPMGR_LOG_LEVEL");
    if (env == nullptr)
        return LogLevel::Warning;

    std::string value(env);
    if (value == "debug")
        return LogLevel::Debug;
    if (value == "info")
        return LogLevel::Info;
    if (value == "error")
        return LogLevel::Error;
    return LogLevel::Warning;
}

Logger::Logger(std::string component, std::optional<LogCallback> callback)
    : component_(std::move(component)), callback_(std::move(callback)),
      threshold_(log_level_from_env())
{
}

void Logger::debug(const std::string& message) const
{
    log(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) const
{
    log(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) const
{
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) const
{
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (callback_.has_value() && *callback_)
    {
        try
        {
            (*callback_)(level, "[" + component_ + "] " + message);
            return;
        }
        catch (const std::exception& e)
        {
            // Fall through to stderr so the line is not lost
            std::lock_guard<std::mutex> lock(stderr_mutex());
            std::cerr << "[" << component_ << "] Warning: log callback threw: " << e.what()
                      << std::endl;
        }
    }

    if (level < threshold_)
        return;

    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[" << component_ << "] " << level_label(level) << ": " << message << std::endl;
}

} // namespace internal
} // namespace mcpmgr
