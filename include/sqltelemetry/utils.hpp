// include/sqltelemetry/utils.hpp
// Purpose: Utility functions and helpers shared across the telemetry pipeline

#pragma once

#include "types.hpp"
#include <string>
#include <chrono>
#include <utility>

namespace sqltelemetry {
namespace Utils {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);

// Network utilities
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint);
bool is_valid_port(uint16_t port);

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms);
std::string current_iso8601_timestamp();

// Exponential backoff calculator
class ExponentialBackoff {
public:
    ExponentialBackoff(std::chrono::milliseconds base_delay,
                       double multiplier = 2.0,
                       std::chrono::milliseconds max_delay = std::chrono::milliseconds(30000));

    std::chrono::milliseconds next_delay();
    void reset();
    int attempt_count() const;

private:
    std::chrono::milliseconds base_delay_;
    double multiplier_;
    std::chrono::milliseconds max_delay_;
    int attempts_;
    std::chrono::milliseconds current_delay_;
};

} // namespace Utils
} // namespace sqltelemetry
