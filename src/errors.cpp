// src/errors.cpp
// Implementation of error category messages and factory functions

#include "sqltelemetry/errors.hpp"
#include <sstream>

namespace sqltelemetry {

std::string SqlTelemetryErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Configuration errors (1-99)
        case ErrorCode::INVALID_CONFIG:
            return "Invalid configuration";
        case ErrorCode::INVALID_THREAD_POOL_SIZE:
            return "Invalid thread pool size";
        case ErrorCode::INVALID_FLUSH_INTERVAL:
            return "Invalid flush interval";
        case ErrorCode::INVALID_CIRCUIT_BREAKER_CONFIG:
            return "Invalid circuit breaker configuration";

        // Caller errors (100-199)
        case ErrorCode::INVALID_ARGUMENT:
            return "Invalid argument";
        case ErrorCode::NULL_REFERENCE:
            return "Null reference";

        // Network errors (200-299)
        case ErrorCode::CONNECTION_FAILED:
            return "Connection failed";
        case ErrorCode::CONNECTION_TIMEOUT:
            return "Connection timeout";
        case ErrorCode::CONNECTION_REFUSED:
            return "Connection refused";
        case ErrorCode::DNS_RESOLUTION_FAILED:
            return "DNS resolution failed";
        case ErrorCode::NETWORK_UNREACHABLE:
            return "Network unreachable";
        case ErrorCode::SEND_FAILED:
            return "Send operation failed";

        // Protocol errors (300-399)
        case ErrorCode::SERIALIZATION_FAILED:
            return "Serialization failed";

        // Server errors (500-599)
        case ErrorCode::SERVER_ERROR:
            return "Server error";
        case ErrorCode::SERVICE_UNAVAILABLE:
            return "Service unavailable";

        // Client state errors (600-699)
        case ErrorCode::CLIENT_CLOSED:
            return "Client closed";
        case ErrorCode::TASK_REJECTED:
            return "Task rejected";
        case ErrorCode::CIRCUIT_OPEN:
            return "Circuit breaker open";

        // System errors (700-799)
        case ErrorCode::OUT_OF_MEMORY:
            return "Out of memory";
        case ErrorCode::RESOURCE_EXHAUSTED:
            return "Resource exhausted";

        // Unknown/Generic errors (800+)
        case ErrorCode::UNKNOWN_ERROR:
            return "Unknown error";
        case ErrorCode::TIMEOUT:
            return "Operation timeout";

        default:
            return "Unknown error code";
    }
}

const SqlTelemetryErrorCategory& sqltelemetry_error_category() {
    static const SqlTelemetryErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return std::error_code{static_cast<int>(ec), sqltelemetry_error_category()};
}

namespace Errors {

// Configuration errors
ConfigError invalid_thread_pool_size(size_t size) {
    return ConfigError(ErrorCode::INVALID_THREAD_POOL_SIZE, "thread_pool_size",
        "Thread pool size must be between 1 and 64, got: " + std::to_string(size));
}

ConfigError invalid_flush_interval(std::chrono::milliseconds interval) {
    return ConfigError(ErrorCode::INVALID_FLUSH_INTERVAL, "flush_interval",
        "Flush interval must be 0 (disabled) or between 100ms and 300s, got: " +
        std::to_string(interval.count()) + "ms");
}

ConfigError invalid_circuit_breaker_config(const std::string& field, const std::string& reason) {
    return ConfigError(ErrorCode::INVALID_CIRCUIT_BREAKER_CONFIG, field, reason);
}

// Caller errors
ValidationError invalid_argument(const std::string& field, const std::string& reason) {
    return ValidationError(ErrorCode::INVALID_ARGUMENT, field, reason);
}

ValidationError null_reference(const std::string& field) {
    return ValidationError(ErrorCode::NULL_REFERENCE, field, "Value must not be null");
}

// Network errors
NetworkError connection_failed(const std::string& endpoint) {
    return NetworkError(ErrorCode::CONNECTION_FAILED, "connect",
        "Failed to connect to " + endpoint);
}

NetworkError connection_refused(const std::string& endpoint) {
    return NetworkError(ErrorCode::CONNECTION_REFUSED, "connect",
        "Connection refused by " + endpoint);
}

NetworkError dns_resolution_failed(const std::string& hostname) {
    return NetworkError(ErrorCode::DNS_RESOLUTION_FAILED, "dns_resolve",
        "Failed to resolve hostname: " + hostname);
}

NetworkError send_failed(const std::string& reason) {
    return NetworkError(ErrorCode::SEND_FAILED, "send", reason);
}

// Protocol errors
ProtocolError serialization_failed(const std::string& type, const std::string& reason) {
    return ProtocolError(ErrorCode::SERIALIZATION_FAILED, "serialize",
        "Failed to serialize " + type + ": " + reason);
}

// Server errors
ServerError server_error(int status_code, const std::string& message) {
    return ServerError(ErrorCode::SERVER_ERROR, message, status_code);
}

ServerError service_unavailable() {
    return ServerError(ErrorCode::SERVICE_UNAVAILABLE,
        "Telemetry service temporarily unavailable", 503);
}

// Client errors
ClientError client_closed() {
    return ClientError(ErrorCode::CLIENT_CLOSED,
        "Telemetry client has been closed");
}

ClientError task_rejected(const std::string& reason) {
    return ClientError(ErrorCode::TASK_REJECTED,
        "Push task rejected: " + reason);
}

ClientError circuit_open(const std::string& name) {
    std::ostringstream oss;
    oss << "Circuit breaker '" << name << "' is open, call not permitted";
    return ClientError(ErrorCode::CIRCUIT_OPEN, oss.str());
}

// System errors
SystemError resource_exhausted(const std::string& resource) {
    return SystemError(ErrorCode::RESOURCE_EXHAUSTED,
        "Resource exhausted: " + resource);
}

} // namespace Errors
} // namespace sqltelemetry
