#include "tradecore/Logger.hpp"

#include <iostream>
#include <utility>

namespace tradecore {

std::mutex Logger::mutex_;
std::mutex Logger::output_mutex_;
LogLevel Logger::level_ = LogLevel::Info;
Logger::LogCallback Logger::callback_ = nullptr;

std::string_view to_string(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::log(LogLevel level, std::string_view component, const std::string& message)
{
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) {
            return;
        }
        callback = callback_;
    }

    std::string line;
    line.reserve(component.size() + message.size() + 3);
    line += '[';
    line += component;
    line += "] ";
    line += message;

    // The callback runs unlocked so it may call back into Logger.
    if (callback) {
        callback(level, line);
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (level >= LogLevel::Warning) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void Logger::set_callback(LogCallback cb)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(cb);
}

void Logger::clear_callback()
{
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = nullptr;
}

} // namespace tradecore
