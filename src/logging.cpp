// src/logging.cpp
// Implementation of the SDK-internal stderr logger

#include "sqltelemetry/logging.hpp"
#include "sqltelemetry/config.hpp"
#include "sqltelemetry/utils.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sqltelemetry {
namespace Log {

namespace {

SystemLogLevel initial_level() {
    auto from_env = EnvConfig::get_log_level();
    return from_env ? *from_env : SystemLogLevel::ERROR;
}

std::atomic<uint8_t>& current_level() {
    static std::atomic<uint8_t> level{static_cast<uint8_t>(initial_level())};
    return level;
}

std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

void set_level(SystemLogLevel level) {
    current_level().store(static_cast<uint8_t>(level));
}

SystemLogLevel level() {
    return static_cast<SystemLogLevel>(current_level().load());
}

bool is_enabled(SystemLogLevel level) {
    return level != SystemLogLevel::NONE &&
           static_cast<uint8_t>(level) <= current_level().load();
}

void write(SystemLogLevel level, const std::string& component, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }

    std::ostringstream line;
    line << Utils::current_iso8601_timestamp() << " [sqltelemetry] "
         << level_to_string(level) << " " << component << ": " << message;

    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << line.str() << std::endl;
}

std::string level_to_string(SystemLogLevel level) {
    switch (level) {
        case SystemLogLevel::NONE: return "NONE";
        case SystemLogLevel::ERROR: return "ERROR";
        case SystemLogLevel::WARN: return "WARN";
        case SystemLogLevel::INFO: return "INFO";
        case SystemLogLevel::DEBUG: return "DEBUG";
        case SystemLogLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

} // namespace Log
} // namespace sqltelemetry
