// include/sqltelemetry/errors.hpp
// Purpose: Error taxonomy for the telemetry export pipeline
// Transport failures, caller errors, serialization failures and client state errors

#pragma once

#include <stdexcept>
#include <string>
#include <chrono>
#include <system_error>

namespace sqltelemetry {

class SqlTelemetryErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "sqltelemetry";
    }

    std::string message(int ev) const override;
};

const SqlTelemetryErrorCategory& sqltelemetry_error_category();

enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Configuration errors (1-99)
    INVALID_CONFIG = 1,
    INVALID_THREAD_POOL_SIZE = 3,
    INVALID_FLUSH_INTERVAL = 4,
    INVALID_CIRCUIT_BREAKER_CONFIG = 5,

    // Caller errors (100-199)
    INVALID_ARGUMENT = 100,
    NULL_REFERENCE = 101,

    // Network errors (200-299)
    CONNECTION_FAILED = 200,
    CONNECTION_TIMEOUT = 201,
    CONNECTION_REFUSED = 202,
    DNS_RESOLUTION_FAILED = 203,
    NETWORK_UNREACHABLE = 204,
    SEND_FAILED = 205,

    // Protocol errors (300-399)
    SERIALIZATION_FAILED = 300,

    // Server errors (500-599)
    SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 501,

    // Client state errors (600-699)
    CLIENT_CLOSED = 600,
    TASK_REJECTED = 601,
    CIRCUIT_OPEN = 602,

    // System errors (700-799)
    OUT_OF_MEMORY = 700,
    RESOURCE_EXHAUSTED = 701,

    // Unknown/Generic errors (800+)
    UNKNOWN_ERROR = 800,
    TIMEOUT = 801
};

std::error_code make_error_code(ErrorCode ec);

// Base exception class for all sqltelemetry errors
class Error : public std::exception {
public:
    explicit Error(const std::string& message)
        : message_(message)
        , error_code_(ErrorCode::UNKNOWN_ERROR)
        , timestamp_(std::chrono::system_clock::now()) {}

    Error(ErrorCode code, const std::string& message)
        : message_(message)
        , error_code_(code)
        , timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept {
        return error_code_;
    }

    std::chrono::system_clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

    virtual std::string category() const {
        return "sqltelemetry::Error";
    }

protected:
    std::string message_;
    ErrorCode error_code_;
    std::chrono::system_clock::time_point timestamp_;
};

class ConfigError : public Error {
public:
    ConfigError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Configuration error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "sqltelemetry::ConfigError";
    }

private:
    std::string field_;
};

// Caller/programmer errors; never counted against the circuit breaker
class ValidationError : public Error {
public:
    ValidationError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Validation error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "sqltelemetry::ValidationError";
    }

private:
    std::string field_;
};

class NetworkError : public Error {
public:
    NetworkError(ErrorCode code, const std::string& operation, const std::string& message)
        : Error(code, "Network error during '" + operation + "': " + message)
        , operation_(operation)
        , retries_(0) {}

    NetworkError(ErrorCode code, const std::string& operation, const std::string& message,
                int retries)
        : Error(code, "Network error during '" + operation + "' after " +
               std::to_string(retries) + " retries: " + message)
        , operation_(operation)
        , retries_(retries) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    int retries() const noexcept {
        return retries_;
    }

    std::string category() const override {
        return "sqltelemetry::NetworkError";
    }

private:
    std::string operation_;
    int retries_;
};

class TimeoutError : public Error {
public:
    TimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : Error(ErrorCode::TIMEOUT, "Operation '" + operation + "' timed out after " +
               std::to_string(timeout.count()) + "ms")
        , operation_(operation)
        , timeout_(timeout) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::chrono::milliseconds timeout() const noexcept {
        return timeout_;
    }

    std::string category() const override {
        return "sqltelemetry::TimeoutError";
    }

private:
    std::string operation_;
    std::chrono::milliseconds timeout_;
};

class ProtocolError : public Error {
public:
    ProtocolError(ErrorCode code, const std::string& operation, const std::string& message)
        : Error(code, "Protocol error during '" + operation + "': " + message)
        , operation_(operation) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::string category() const override {
        return "sqltelemetry::ProtocolError";
    }

private:
    std::string operation_;
};

class ServerError : public Error {
public:
    ServerError(ErrorCode code, const std::string& message, int status_code)
        : Error(code, "Server error (" + std::to_string(status_code) + "): " + message)
        , status_code_(status_code) {}

    int status_code() const noexcept {
        return status_code_;
    }

    std::string category() const override {
        return "sqltelemetry::ServerError";
    }

private:
    int status_code_;
};

class ClientError : public Error {
public:
    ClientError(ErrorCode code, const std::string& message)
        : Error(code, "Client error: " + message) {}

    std::string category() const override {
        return "sqltelemetry::ClientError";
    }
};

class SystemError : public Error {
public:
    SystemError(ErrorCode code, const std::string& message)
        : Error(code, "System error: " + message) {}

    std::string category() const override {
        return "sqltelemetry::SystemError";
    }
};

// Error factory functions for common error scenarios
namespace Errors {

// Configuration errors
ConfigError invalid_thread_pool_size(size_t size);
ConfigError invalid_flush_interval(std::chrono::milliseconds interval);
ConfigError invalid_circuit_breaker_config(const std::string& field, const std::string& reason);

// Caller errors
ValidationError invalid_argument(const std::string& field, const std::string& reason);
ValidationError null_reference(const std::string& field);

// Network errors
NetworkError connection_failed(const std::string& endpoint);
NetworkError connection_refused(const std::string& endpoint);
NetworkError dns_resolution_failed(const std::string& hostname);
NetworkError send_failed(const std::string& reason);

// Protocol errors
ProtocolError serialization_failed(const std::string& type, const std::string& reason);

// Server errors
ServerError server_error(int status_code, const std::string& message);
ServerError service_unavailable();

// Client errors
ClientError client_closed();
ClientError task_rejected(const std::string& reason);
ClientError circuit_open(const std::string& name);

// System errors
SystemError resource_exhausted(const std::string& resource);

} // namespace Errors

} // namespace sqltelemetry

namespace std {
template <>
struct is_error_code_enum<sqltelemetry::ErrorCode> : true_type {};
}
