// include/sqltelemetry/config.hpp
// Purpose: Configuration for the telemetry export pipeline
// Registry-wide settings, per-connection context and circuit breaker parameters

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <string>
#include <chrono>
#include <optional>
#include <unordered_map>
#include <vector>

namespace sqltelemetry {

// Settings for the default TCP push client
struct NetworkConfig {
    std::chrono::milliseconds connect_timeout{5000};    // 5 seconds
    std::chrono::milliseconds send_timeout{10000};      // 10 seconds
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{200};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_retry_delay{5000};
};

// Registry-wide configuration
struct TelemetryConfig {
    size_t thread_pool_size = 10;                        // Shared push workers
    size_t max_pending_tasks = 1000;                     // Queued push tasks before rejection
    std::chrono::milliseconds flush_interval{5000};      // 0 disables the periodic flush
    NetworkConfig network;
    SystemLogLevel log_level = SystemLogLevel::ERROR;

    void validate() const;
    bool is_valid() const noexcept;
    std::vector<std::string> validation_errors() const;

    // Defaults overridden by SQLTELEMETRY_* environment variables where set
    static TelemetryConfig from_environment();
};

// Circuit breaker parameters. Absence (std::nullopt) means no breaker is applied.
struct CircuitBreakerConfig {
    float failure_rate_threshold = 50.0f;               // Percent
    int minimum_number_of_calls = 10;
    int sliding_window_size = 20;
    std::chrono::seconds wait_duration_in_open_state{60};
    int permitted_calls_in_half_open_state = 5;

    void validate() const;
};

// Connection-level settings exposed by the driver (external collaborator)
class ConnectionContext {
public:
    virtual ~ConnectionContext() = default;

    virtual ConnectionId connection_id() const = 0;
    virtual HostUrl host_url() const = 0;

    virtual bool is_telemetry_allowed() const = 0;
    virtual size_t telemetry_batch_size() const = 0;

    virtual bool is_circuit_breaker_enabled() const = 0;
    virtual float circuit_breaker_failure_rate_threshold() const = 0;
    virtual int circuit_breaker_minimum_number_of_calls() const = 0;
    virtual int circuit_breaker_sliding_window_size() const = 0;
    virtual std::chrono::seconds circuit_breaker_wait_duration_in_open_state() const = 0;
    virtual int circuit_breaker_permitted_calls_in_half_open_state() const = 0;
};

// Property keys understood by PropertiesConnectionContext
namespace PropertyKeys {
    constexpr const char* TELEMETRY_ENABLED = "telemetry.enabled";
    constexpr const char* TELEMETRY_BATCH_SIZE = "telemetry.batch.size";
    constexpr const char* CIRCUIT_BREAKER_ENABLED = "telemetry.circuit.breaker.enabled";
    constexpr const char* CIRCUIT_BREAKER_FAILURE_RATE = "telemetry.circuit.breaker.failure.rate";
    constexpr const char* CIRCUIT_BREAKER_MIN_CALLS = "telemetry.circuit.breaker.min.calls";
    constexpr const char* CIRCUIT_BREAKER_WINDOW_SIZE = "telemetry.circuit.breaker.window.size";
    constexpr const char* CIRCUIT_BREAKER_WAIT_DURATION = "telemetry.circuit.breaker.wait.duration";
    constexpr const char* CIRCUIT_BREAKER_HALF_OPEN_CALLS = "telemetry.circuit.breaker.half.open.calls";
}

// ConnectionContext over a string property map; missing or unparseable values use defaults
class PropertiesConnectionContext : public ConnectionContext {
public:
    using PropertyMap = std::unordered_map<std::string, std::string>;

    static constexpr size_t DEFAULT_BATCH_SIZE = 200;

    PropertiesConnectionContext(ConnectionId connection_id, HostUrl host_url,
                                PropertyMap properties = {});

    ConnectionId connection_id() const override { return connection_id_; }
    HostUrl host_url() const override { return host_url_; }

    bool is_telemetry_allowed() const override;
    size_t telemetry_batch_size() const override;

    bool is_circuit_breaker_enabled() const override;
    float circuit_breaker_failure_rate_threshold() const override;
    int circuit_breaker_minimum_number_of_calls() const override;
    int circuit_breaker_sliding_window_size() const override;
    std::chrono::seconds circuit_breaker_wait_duration_in_open_state() const override;
    int circuit_breaker_permitted_calls_in_half_open_state() const override;

    std::optional<std::string> property(const std::string& key) const;

private:
    bool get_bool(const std::string& key, bool default_value) const;
    float get_float(const std::string& key, float default_value) const;
    int get_int(const std::string& key, int default_value) const;

    ConnectionId connection_id_;
    HostUrl host_url_;
    PropertyMap properties_;
};

// Maps a connection's settings to breaker parameters
class CircuitBreakerConfigurator {
public:
    // std::nullopt when the breaker is disabled for the connection.
    // Out-of-range values are replaced by their defaults.
    static std::optional<CircuitBreakerConfig> create_config(const ConnectionContext& context);
};

// Environment variable configuration loader
class EnvConfig {
public:
    // SQLTELEMETRY_LOG_LEVEL: NONE, ERROR, WARN, INFO, DEBUG, TRACE
    static std::optional<SystemLogLevel> get_log_level();
    // SQLTELEMETRY_THREAD_POOL_SIZE
    static std::optional<size_t> get_thread_pool_size();
    // SQLTELEMETRY_FLUSH_INTERVAL_MS
    static std::optional<std::chrono::milliseconds> get_flush_interval();

private:
    static std::optional<std::string> get_env(const std::string& name);
    static std::optional<int> get_env_int(const std::string& name);
};

} // namespace sqltelemetry
