// common/utils/logger.cpp
#include "common/utils/logger.h"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace agentflow {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_output_mutex; // 多线程 (layer fan-out) 输出不交错

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO: return "[INFO]";
        case LogLevel::WARNING: return "[WARNING]";
        case LogLevel::ERROR: return "[ERROR]";
        case LogLevel::OFF: break;
    }
    return "";
}

} // namespace

LogLevel log_level_from_string(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off" || name == "none") return LogLevel::OFF;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

void Logger::set_level(LogLevel level) {
    g_level.store(level);
}

LogLevel Logger::level() {
    return g_level.load();
}

bool Logger::enabled(LogLevel level) {
    return level != LogLevel::OFF && level >= g_level.load();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
    out << level_tag(level) << " [" << component << "] " << message << std::endl;
}

} // namespace agentflow
