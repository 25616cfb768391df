/**
 * @file Logger.cpp
 * @brief Logger implementation
 * @copyright Radarscope signal radar
 */

#include "radarscope/utils/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace radarscope {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
std::mutex g_sinkMutex;
Logger::Sink g_sink;

void writeToClog(LogLevel level, const std::string& component,
                 const std::string& message) {
    std::clog << "[" << logLevelToString(level) << "] "
              << component << ": " << message << std::endl;
}

}  // anonymous namespace

LogLevel stringToLogLevel(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return LogLevel::DEBUG;
    if (s == "INFO") return LogLevel::INFO;
    if (s == "ERROR") return LogLevel::ERROR;
    if (s == "OFF") return LogLevel::OFF;
    return LogLevel::WARN;
}

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::getLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::isEnabled(LogLevel level) {
    return level != LogLevel::OFF && static_cast<int>(level) >= g_level.load();
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& component,
                 const std::string& message) {
    if (!isEnabled(level)) return;

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink) {
        g_sink(level, component, message);
    } else {
        writeToClog(level, component, message);
    }
}

} // namespace radarscope
