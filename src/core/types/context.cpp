// core/types/context.cpp
#include "core/types/context.h"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace agentflow {

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

std::string format_timestamp(TimePoint tp) {
    int64_t ms = to_epoch_ms(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return oss.str();
}

TimePoint parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::runtime_error("Invalid timestamp: " + text);
    }
    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        iss >> millis;
    }
    std::time_t secs = timegm(&tm);
    return from_epoch_ms(static_cast<int64_t>(secs) * 1000 + millis);
}

} // namespace agentflow
