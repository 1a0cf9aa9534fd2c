#include "logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace baseobject
{
namespace log
{
namespace
{
constexpr std::array<std::string_view, 6> kLevelNames = { "SILENT", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL" };

// grey, blue, green, magenta, yellow, red
constexpr std::array<std::string_view, 6> kLevelColours = { "\033[90m", "\033[94m", "\033[92m", "\033[95m", "\033[93m", "\033[91m" };

constexpr std::string_view kResetColour = "\033[0m";

std::string timestamp()
{
    auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local {};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
} // namespace

std::string_view levelName(Level level)
{
    return kLevelNames.at(static_cast<std::size_t>(level));
}

Level parseLevel(std::string_view name, Level fallback)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [] (unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = std::find(kLevelNames.begin(), kLevelNames.end(), upper);
    if (it == kLevelNames.end())
        return fallback;

    return static_cast<Level>(std::distance(kLevelNames.begin(), it));
}

Logger::Logger(std::string name_, Level threshold_, std::ostream& stream_)
    : loggerName(std::move(name_)), threshold(threshold_), stream(&stream_)
{}

void Logger::log(Level level_, std::string_view message) const
{
    if (! isEnabled(level_))
        return;

    auto const idx = static_cast<std::size_t>(level_);

    if (coloured)
        *stream << kLevelColours.at(idx);

    *stream << "[" << timestamp() << "] - [" << kLevelNames.at(idx) << "] - [" << loggerName << "] - " << message;

    if (coloured)
        *stream << kResetColour;

    *stream << std::endl;
}

} // namespace log
} // namespace baseobject
