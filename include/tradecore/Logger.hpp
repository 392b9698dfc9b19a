#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace tradecore {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

std::string_view to_string(LogLevel level);

// Process-wide logger. Messages go to the installed callback, or to
// stdout (Debug/Info) / stderr (Warning/Error) as "[Component] message".
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static void log(LogLevel level, std::string_view component, const std::string& message);

    static void debug(std::string_view component, const std::string& message) { log(LogLevel::Debug, component, message); }
    static void info(std::string_view component, const std::string& message) { log(LogLevel::Info, component, message); }
    static void warning(std::string_view component, const std::string& message) { log(LogLevel::Warning, component, message); }
    static void error(std::string_view component, const std::string& message) { log(LogLevel::Error, component, message); }

    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    static void set_callback(LogCallback cb);
    static void clear_callback();

private:
    static std::mutex mutex_;
    static std::mutex output_mutex_;
    static LogLevel level_;
    static LogCallback callback_;
};

} // namespace tradecore
