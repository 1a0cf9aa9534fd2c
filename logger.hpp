/**
 * @file logger.hpp
 * @brief Leveled console logger
 *
 * Writes one line per message in the form
 *   [2024-01-24 12:00:00] - [INFO] - [name] - message
 * coloured by level. Messages below the logger's threshold are dropped.
 *
 * Usage example:
 *   log::Logger logger("demo", log::Level::debug);
 *   BASEOBJECT_LOG_INFO(logger, "Created " << person);
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace baseobject
{
namespace log
{

/// Log levels in ascending order of severity
enum class Level
{
    silent,
    debug,
    info,
    warning,
    error,
    critical
};

/// Returns the upper case name of a level ("INFO", "WARNING", ...)
std::string_view levelName(Level level);

/// Parses a level name case-insensitively, returns fallback if the name is not known
Level parseLevel(std::string_view name, Level fallback = Level::info);

/**
 * @brief A named logger writing to a stream
 *
 * The logger does not own its stream; the stream must outlive it.
 */
class Logger
{
public:
    explicit Logger(std::string name_, Level threshold_ = Level::info, std::ostream& stream_ = std::clog);

    std::string const& name() const { return loggerName; }
    void setName(std::string name_) { loggerName = std::move(name_); }

    /// Messages below this level are dropped
    Level level() const { return threshold; }
    void setLevel(Level level_) { threshold = level_; }

    /// Returns true if messages of the given level are written
    bool isEnabled(Level level_) const { return level_ >= threshold; }

    /// Enables or disables ANSI colour codes (enabled by default)
    void setColoured(bool shouldColour) { coloured = shouldColour; }

    /// Writes message at the given level
    void log(Level level_, std::string_view message) const;

    void silent(std::string_view message) const   { log(Level::silent, message); }
    void debug(std::string_view message) const    { log(Level::debug, message); }
    void info(std::string_view message) const     { log(Level::info, message); }
    void warning(std::string_view message) const  { log(Level::warning, message); }
    void error(std::string_view message) const    { log(Level::error, message); }
    void critical(std::string_view message) const { log(Level::critical, message); }

private:
    std::string loggerName;
    Level threshold;
    std::ostream* stream;
    bool coloured = true;
};

} // namespace log
} // namespace baseobject

/// Streams msg into a message and logs it, skips the formatting if the level is disabled
#define BASEOBJECT_LOG(logger, level, msg)                 \
    do {                                                   \
        if ((logger).isEnabled(level)) {                   \
            std::ostringstream oss_;                       \
            oss_ << msg;                                   \
            (logger).log(level, oss_.str());               \
        }                                                  \
    } while (false)

#define BASEOBJECT_LOG_SILENT(logger, msg)   BASEOBJECT_LOG(logger, ::baseobject::log::Level::silent, msg)
#define BASEOBJECT_LOG_DEBUG(logger, msg)    BASEOBJECT_LOG(logger, ::baseobject::log::Level::debug, msg)
#define BASEOBJECT_LOG_INFO(logger, msg)     BASEOBJECT_LOG(logger, ::baseobject::log::Level::info, msg)
#define BASEOBJECT_LOG_WARNING(logger, msg)  BASEOBJECT_LOG(logger, ::baseobject::log::Level::warning, msg)
#define BASEOBJECT_LOG_ERROR(logger, msg)    BASEOBJECT_LOG(logger, ::baseobject::log::Level::error, msg)
#define BASEOBJECT_LOG_CRITICAL(logger, msg) BASEOBJECT_LOG(logger, ::baseobject::log::Level::critical, msg)
