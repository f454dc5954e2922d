// include/sqltelemetry/logging.hpp
// Purpose: SDK-internal diagnostic logging (not the telemetry events themselves)
// Level-gated, writes to stderr; telemetry degradation is reported here and nowhere else

#pragma once

#include <cstdint>
#include <string>

namespace sqltelemetry {

enum class SystemLogLevel : uint8_t {
    NONE = 0,       // No SDK logging
    ERROR = 1,      // Only errors
    WARN = 2,       // Warnings and errors
    INFO = 3,       // Informational + above
    DEBUG = 4,      // Debug + above
    TRACE = 5       // Everything
};

namespace Log {

void set_level(SystemLogLevel level);
SystemLogLevel level();
bool is_enabled(SystemLogLevel level);

// Writes "<iso8601> [sqltelemetry] LEVEL component: message" when the level is enabled
void write(SystemLogLevel level, const std::string& component, const std::string& message);

inline void error(const std::string& component, const std::string& message) {
    write(SystemLogLevel::ERROR, component, message);
}

inline void warn(const std::string& component, const std::string& message) {
    write(SystemLogLevel::WARN, component, message);
}

inline void info(const std::string& component, const std::string& message) {
    write(SystemLogLevel::INFO, component, message);
}

inline void debug(const std::string& component, const std::string& message) {
    write(SystemLogLevel::DEBUG, component, message);
}

inline void trace(const std::string& component, const std::string& message) {
    write(SystemLogLevel::TRACE, component, message);
}

std::string level_to_string(SystemLogLevel level);

} // namespace Log
} // namespace sqltelemetry
