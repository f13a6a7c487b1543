#include "ftmcpp/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace ftmcpp::util::log
{

Level level_from_string(const std::string& name)
{
    std::string lvl = name;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "DEBUG")
        return Level::Debug;
    if (lvl == "WARN" || lvl == "WARNING")
        return Level::Warning;
    if (lvl == "ERROR")
        return Level::Error;
    if (lvl == "OFF" || lvl == "NONE")
        return Level::Off;
    return Level::Info;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

Logger::Logger() : stream_(&std::cerr) {}

void Logger::write(Level level, const std::string& message) const
{
    if (!enabled(level))
        return;
    *stream_ << "[ftmcpp] " << to_string(level) << ": " << message << std::endl;
}

} // namespace ftmcpp::util::log
