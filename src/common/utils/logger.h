// common/utils/logger.h
#ifndef AGENTFLOW_COMMON_UTILS_LOGGER_H
#define AGENTFLOW_COMMON_UTILS_LOGGER_H

#include <cstdint>
#include <string>
#include <string_view>

namespace agentflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

LogLevel log_level_from_string(std::string_view name);

// "[LEVEL] [component] message"; DEBUG/INFO -> stdout, WARNING/ERROR -> stderr
class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    static void log(LogLevel level, std::string_view component, std::string_view message);

    static void debug(std::string_view component, std::string_view message) { log(LogLevel::DEBUG, component, message); }
    static void info(std::string_view component, std::string_view message) { log(LogLevel::INFO, component, message); }
    static void warning(std::string_view component, std::string_view message) { log(LogLevel::WARNING, component, message); }
    static void error(std::string_view component, std::string_view message) { log(LogLevel::ERROR, component, message); }
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_LOGGER_H
