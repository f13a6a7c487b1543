#pragma once
#include <ostream>
#include <string>

namespace ftmcpp::util::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Parse "DEBUG", "INFO", "WARN"/"WARNING", "ERROR", "OFF" (case-insensitive).
/// Unknown names fall back to Info.
Level level_from_string(const std::string& name);
const char* to_string(Level level);

/// Leveled diagnostics written to a caller-owned stream.
class Logger
{
  public:
    Logger();
    Logger(std::ostream* stream, Level threshold) : stream_(stream), threshold_(threshold) {}

    bool enabled(Level level) const
    {
        return stream_ != nullptr && level != Level::Off && level >= threshold_;
    }

    void write(Level level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        write(Level::Debug, message);
    }
    void info(const std::string& message) const
    {
        write(Level::Info, message);
    }
    void warning(const std::string& message) const
    {
        write(Level::Warning, message);
    }
    void error(const std::string& message) const
    {
        write(Level::Error, message);
    }

    Level threshold() const
    {
        return threshold_;
    }
    void set_threshold(Level level)
    {
        threshold_ = level;
    }
    void set_stream(std::ostream* stream)
    {
        stream_ = stream;
    }

  private:
    std::ostream* stream_ = nullptr;
    Level threshold_{Level::Info};
};

} // namespace ftmcpp::util::log
