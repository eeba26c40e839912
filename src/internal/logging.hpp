#ifndef MCPMGR_INTERNAL_LOGGING_HPP
#define MCPMGR_INTERNAL_LOGGING_HPP

#include <mcpmgr/types.hpp>
#include <optional>
#include <string>

namespace mcpmgr
{
namespace internal
{

/**
 * Component logger.
 *
 * Forwards every line to the configured callback. Without a callback,
 * warnings and errors go to std::cerr as "[Component] Warning: ..." and
 * info/debug lines only when MCPMGR_LOG_LEVEL asks for them.
 */
class Logger
{
  public:
    Logger(std::string component, std::optional<LogCallback> callback);

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;

    void log(LogLevel level, const std::string& message) const;

    const std::string& component() const
    {
        return component_;
    }

  private:
    std::string component_;
    std::optional<LogCallback> callback_;
    LogLevel threshold_;
};

// Level selected by MCPMGR_LOG_LEVEL (debug, info, warning, error); warning by default
LogLevel log_level_from_env();

} // namespace internal
} // namespace mcpmgr

#endif // MCPMGR_INTERNAL_LOGGING_HPP
