// src/utils.cpp
// Implementation of utility functions for common operations

#include "sqltelemetry/utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqltelemetry {
namespace Utils {

// String utilities
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

// Network utilities
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint) {
    size_t colon_pos = endpoint.find_last_of(':');
    if (colon_pos == std::string::npos) {
        return {"", 0};
    }

    std::string host = endpoint.substr(0, colon_pos);
    std::string port_str = endpoint.substr(colon_pos + 1);

    try {
        unsigned long port = std::stoul(port_str);
        if (port > 65535) {
            return {"", 0};
        }
        return {host, static_cast<uint16_t>(port)};
    } catch (const std::exception&) {
        return {"", 0};
    }
}

bool is_valid_port(uint16_t port) {
    return port > 0;
}

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms) {
    std::time_t time = static_cast<std::time_t>(timestamp_ms / 1000);
    auto ms = timestamp_ms % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return ss.str();
}

std::string current_iso8601_timestamp() {
    return timestamp_to_iso8601(now_milliseconds());
}

// ExponentialBackoff implementation
ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds base_delay,
                                       double multiplier,
                                       std::chrono::milliseconds max_delay)
    : base_delay_(base_delay), multiplier_(multiplier), max_delay_(max_delay),
      attempts_(0), current_delay_(base_delay) {}

std::chrono::milliseconds ExponentialBackoff::next_delay() {
    if (attempts_ == 0) {
        attempts_++;
        return current_delay_;
    }

    attempts_++;
    current_delay_ = std::chrono::milliseconds(
        static_cast<long long>(current_delay_.count() * multiplier_)
    );

    if (current_delay_ > max_delay_) {
        current_delay_ = max_delay_;
    }

    return current_delay_;
}

void ExponentialBackoff::reset() {
    attempts_ = 0;
    current_delay_ = base_delay_;
}

int ExponentialBackoff::attempt_count() const {
    return attempts_;
}

} // namespace Utils
} // namespace sqltelemetry
