// Console logger with a swappable sink and a minimum level filter.
#pragma once

#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace Bulwark {

enum class LogLevel { Debug, Info, Warning, Error };

using LogSink = std::function<void(LogLevel, std::string_view)>;

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    static void setMinimumLevel(LogLevel level);
    static LogLevel minimumLevel();

    // Routes messages to `sink` instead of stdout until resetSink() is called.
    static void setSink(LogSink sink);
    static void resetSink();
};

std::string_view toLabel(LogLevel level);

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Bulwark
