#pragma once

#include <functional>
#include <string>

namespace relpack
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Accepts DEBUG/INFO/WARN/WARNING/ERROR in any case; anything else is Info.
LogLevel log_level_from_string(const std::string& s);

/// Receives every line that passes the level filter, already tagged.
using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Line-oriented console logger.
///
/// Produces the tagged lines used throughout relpack:
/// @code
/// [STEP] Check Go toolchain
/// [OK]   go version go1.22.1 linux/amd64
/// [WARN] Failed: windows/arm64
/// [FAIL] Missing command: go
/// @endcode
class Logger
{
  public:
    Logger();
    explicit Logger(LogSink sink, LogLevel min_level = LogLevel::Info);

    void set_level(LogLevel level)
    {
        min_level_ = level;
    }
    LogLevel level() const
    {
        return min_level_;
    }

    void step(const std::string& message) const;
    void ok(const std::string& message) const;
    void warn(const std::string& message) const;
    void fail(const std::string& message) const;

    /// Untagged line (banners, summaries).
    void info(const std::string& message) const;
    void debug(const std::string& message) const;

  private:
    void emit(LogLevel level, const std::string& line) const;

    LogSink sink_;
    LogLevel min_level_{LogLevel::Info};
};

} // namespace relpack
