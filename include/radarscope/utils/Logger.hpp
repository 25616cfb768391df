/**
 * @file Logger.hpp
 * @brief Minimal thread-safe diagnostic logger
 * @copyright Radarscope signal radar
 */

#ifndef RADARSCOPE_UTILS_LOGGER_HPP
#define RADARSCOPE_UTILS_LOGGER_HPP

#include <functional>
#include <sstream>
#include <string>

namespace radarscope {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "OFF";
    }
}

LogLevel stringToLogLevel(const std::string& str);

/**
 * @brief Process-wide logger
 *
 * Messages below the configured level are dropped before formatting.
 * The default sink writes "[LEVEL] component: message" lines to std::clog.
 * A terminal UI that owns the screen should redirect the sink.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string& component,
                                    const std::string& message)>;

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    /**
     * @brief Replace the output sink; an empty sink restores std::clog
     */
    static void setSink(Sink sink);

    static void log(LogLevel level, const std::string& component,
                    const std::string& message);

private:
    Logger() = delete;
};

} // namespace radarscope

#define RADARSCOPE_LOG(level, component, expr)                               \
    do {                                                                     \
        if (::radarscope::Logger::isEnabled(level)) {                        \
            std::ostringstream radarscopeLogStream_;                         \
            radarscopeLogStream_ << expr;                                    \
            ::radarscope::Logger::log(level, component,                      \
                                      radarscopeLogStream_.str());           \
        }                                                                    \
    } while (0)

#define RADARSCOPE_LOG_DEBUG(component, expr) \
    RADARSCOPE_LOG(::radarscope::LogLevel::DEBUG, component, expr)
#define RADARSCOPE_LOG_INFO(component, expr) \
    RADARSCOPE_LOG(::radarscope::LogLevel::INFO, component, expr)
#define RADARSCOPE_LOG_WARN(component, expr) \
    RADARSCOPE_LOG(::radarscope::LogLevel::WARN, component, expr)
#define RADARSCOPE_LOG_ERROR(component, expr) \
    RADARSCOPE_LOG(::radarscope::LogLevel::ERROR, component, expr)

#endif // RADARSCOPE_UTILS_LOGGER_HPP
