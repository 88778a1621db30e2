#include "relpack/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace relpack
{

LogLevel log_level_from_string(const std::string& s)
{
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        return LogLevel::Debug;
    if (v == "WARN" || v == "WARNING")
        return LogLevel::Warning;
    if (v == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

static void console_sink(LogLevel, const std::string& line)
{
    std::cout << line << std::endl;
}

Logger::Logger() : sink_(console_sink) {}

Logger::Logger(LogSink sink, LogLevel min_level) : sink_(std::move(sink)), min_level_(min_level)
{
    if (!sink_)
        sink_ = console_sink;
}

void Logger::step(const std::string& message) const
{
    emit(LogLevel::Info, "[STEP] " + message);
}

void Logger::ok(const std::string& message) const
{
    emit(LogLevel::Info, "[OK]   " + message);
}

void Logger::warn(const std::string& message) const
{
    emit(LogLevel::Warning, "[WARN] " + message);
}

void Logger::fail(const std::string& message) const
{
    emit(LogLevel::Error, "[FAIL] " + message);
}

void Logger::info(const std::string& message) const
{
    emit(LogLevel::Info, message);
}

void Logger::debug(const std::string& message) const
{
    emit(LogLevel::Debug, "[DEBUG] " + message);
}

void Logger::emit(LogLevel level, const std::string& line) const
{
    if (static_cast<int>(level) < static_cast<int>(min_level_))
        return;
    sink_(level, line);
}

} // namespace relpack
