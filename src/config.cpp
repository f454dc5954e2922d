// src/config.cpp
// Implementation of configuration loading, validation and breaker parameter mapping

#include "sqltelemetry/config.hpp"
#include "sqltelemetry/utils.hpp"
#include <cstdlib>
#include <sstream>

namespace sqltelemetry {

// TelemetryConfig implementation
void TelemetryConfig::validate() const {
    std::vector<std::string> errors = validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Configuration validation failed:\n";
        for (const auto& error : errors) {
            oss << "  - " << error << "\n";
        }
        throw ConfigError(ErrorCode::INVALID_CONFIG, "config", oss.str());
    }
}

bool TelemetryConfig::is_valid() const noexcept {
    return validation_errors().empty();
}

std::vector<std::string> TelemetryConfig::validation_errors() const {
    std::vector<std::string> errors;

    if (thread_pool_size == 0 || thread_pool_size > 64) {
        errors.push_back(Errors::invalid_thread_pool_size(thread_pool_size).what());
    }

    if (max_pending_tasks == 0) {
        errors.push_back(ConfigError(ErrorCode::INVALID_CONFIG, "max_pending_tasks",
            "Max pending tasks must be at least 1").what());
    }

    if (flush_interval.count() != 0 &&
        (flush_interval.count() < 100 || flush_interval.count() > 300000)) {
        errors.push_back(Errors::invalid_flush_interval(flush_interval).what());
    }

    if (network.connect_timeout.count() < 100 || network.connect_timeout.count() > 300000) {
        errors.push_back(ConfigError(ErrorCode::INVALID_CONFIG, "connect_timeout",
            "Connect timeout must be between 100ms and 300s").what());
    }
    if (network.send_timeout.count() < 100 || network.send_timeout.count() > 300000) {
        errors.push_back(ConfigError(ErrorCode::INVALID_CONFIG, "send_timeout",
            "Send timeout must be between 100ms and 300s").what());
    }
    if (network.max_retries < 0 || network.max_retries > 10) {
        errors.push_back(ConfigError(ErrorCode::INVALID_CONFIG, "max_retries",
            "Max retries must be between 0 and 10").what());
    }
    if (network.backoff_multiplier < 1.0 || network.backoff_multiplier > 10.0) {
        errors.push_back(ConfigError(ErrorCode::INVALID_CONFIG, "backoff_multiplier",
            "Backoff multiplier must be between 1.0 and 10.0").what());
    }

    return errors;
}

TelemetryConfig TelemetryConfig::from_environment() {
    TelemetryConfig config;

    if (auto pool_size = EnvConfig::get_thread_pool_size()) {
        config.thread_pool_size = *pool_size;
    }

    if (auto interval = EnvConfig::get_flush_interval()) {
        config.flush_interval = *interval;
    }

    if (auto level = EnvConfig::get_log_level()) {
        config.log_level = *level;
    }

    return config;
}

// CircuitBreakerConfig implementation
void CircuitBreakerConfig::validate() const {
    if (!(failure_rate_threshold > 0.0f && failure_rate_threshold <= 100.0f)) {
        throw Errors::invalid_circuit_breaker_config("failure_rate_threshold",
            "must be in (0, 100]");
    }
    if (minimum_number_of_calls < 1) {
        throw Errors::invalid_circuit_breaker_config("minimum_number_of_calls",
            "must be at least 1");
    }
    if (sliding_window_size < 1) {
        throw Errors::invalid_circuit_breaker_config("sliding_window_size",
            "must be at least 1");
    }
    if (wait_duration_in_open_state.count() < 0) {
        throw Errors::invalid_circuit_breaker_config("wait_duration_in_open_state",
            "must not be negative");
    }
    if (permitted_calls_in_half_open_state < 1) {
        throw Errors::invalid_circuit_breaker_config("permitted_calls_in_half_open_state",
            "must be at least 1");
    }
}

// PropertiesConnectionContext implementation
PropertiesConnectionContext::PropertiesConnectionContext(ConnectionId connection_id,
                                                         HostUrl host_url,
                                                         PropertyMap properties)
    : connection_id_(std::move(connection_id))
    , host_url_(std::move(host_url))
    , properties_(std::move(properties)) {}

std::optional<std::string> PropertiesConnectionContext::property(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return Utils::trim(it->second);
}

bool PropertiesConnectionContext::get_bool(const std::string& key, bool default_value) const {
    auto value = property(key);
    if (!value) {
        return default_value;
    }

    std::string lower = Utils::to_lower(*value);
    if (lower == "true" || lower == "1") return true;
    if (lower == "false" || lower == "0") return false;
    return default_value;
}

float PropertiesConnectionContext::get_float(const std::string& key, float default_value) const {
    auto value = property(key);
    if (!value) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        float parsed = std::stof(*value, &consumed);
        return consumed == value->size() ? parsed : default_value;
    } catch (const std::exception&) {
        return default_value;
    }
}

int PropertiesConnectionContext::get_int(const std::string& key, int default_value) const {
    auto value = property(key);
    if (!value) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        int parsed = std::stoi(*value, &consumed);
        return consumed == value->size() ? parsed : default_value;
    } catch (const std::exception&) {
        return default_value;
    }
}

bool PropertiesConnectionContext::is_telemetry_allowed() const {
    return get_bool(PropertyKeys::TELEMETRY_ENABLED, true);
}

size_t PropertiesConnectionContext::telemetry_batch_size() const {
    int size = get_int(PropertyKeys::TELEMETRY_BATCH_SIZE, static_cast<int>(DEFAULT_BATCH_SIZE));
    return size > 0 ? static_cast<size_t>(size) : DEFAULT_BATCH_SIZE;
}

bool PropertiesConnectionContext::is_circuit_breaker_enabled() const {
    return get_bool(PropertyKeys::CIRCUIT_BREAKER_ENABLED, true);
}

float PropertiesConnectionContext::circuit_breaker_failure_rate_threshold() const {
    return get_float(PropertyKeys::CIRCUIT_BREAKER_FAILURE_RATE,
                     CircuitBreakerConfig{}.failure_rate_threshold);
}

int PropertiesConnectionContext::circuit_breaker_minimum_number_of_calls() const {
    return get_int(PropertyKeys::CIRCUIT_BREAKER_MIN_CALLS,
                   CircuitBreakerConfig{}.minimum_number_of_calls);
}

int PropertiesConnectionContext::circuit_breaker_sliding_window_size() const {
    return get_int(PropertyKeys::CIRCUIT_BREAKER_WINDOW_SIZE,
                   CircuitBreakerConfig{}.sliding_window_size);
}

std::chrono::seconds PropertiesConnectionContext::circuit_breaker_wait_duration_in_open_state() const {
    auto seconds = get_int(PropertyKeys::CIRCUIT_BREAKER_WAIT_DURATION,
        static_cast<int>(CircuitBreakerConfig{}.wait_duration_in_open_state.count()));
    return std::chrono::seconds(seconds);
}

int PropertiesConnectionContext::circuit_breaker_permitted_calls_in_half_open_state() const {
    return get_int(PropertyKeys::CIRCUIT_BREAKER_HALF_OPEN_CALLS,
                   CircuitBreakerConfig{}.permitted_calls_in_half_open_state);
}

// CircuitBreakerConfigurator implementation
std::optional<CircuitBreakerConfig> CircuitBreakerConfigurator::create_config(
    const ConnectionContext& context) {
    if (!context.is_circuit_breaker_enabled()) {
        return std::nullopt;
    }

    const CircuitBreakerConfig defaults;
    CircuitBreakerConfig config;
    config.failure_rate_threshold = context.circuit_breaker_failure_rate_threshold();
    config.minimum_number_of_calls = context.circuit_breaker_minimum_number_of_calls();
    config.sliding_window_size = context.circuit_breaker_sliding_window_size();
    config.wait_duration_in_open_state = context.circuit_breaker_wait_duration_in_open_state();
    config.permitted_calls_in_half_open_state =
        context.circuit_breaker_permitted_calls_in_half_open_state();

    if (!(config.failure_rate_threshold > 0.0f && config.failure_rate_threshold <= 100.0f)) {
        Log::warn("CircuitBreakerConfigurator", "failure rate threshold out of range, using default");
        config.failure_rate_threshold = defaults.failure_rate_threshold;
    }
    if (config.minimum_number_of_calls < 1) {
        Log::warn("CircuitBreakerConfigurator", "minimum number of calls out of range, using default");
        config.minimum_number_of_calls = defaults.minimum_number_of_calls;
    }
    if (config.sliding_window_size < 1) {
        Log::warn("CircuitBreakerConfigurator", "sliding window size out of range, using default");
        config.sliding_window_size = defaults.sliding_window_size;
    }
    if (config.wait_duration_in_open_state.count() < 0) {
        Log::warn("CircuitBreakerConfigurator", "wait duration out of range, using default");
        config.wait_duration_in_open_state = defaults.wait_duration_in_open_state;
    }
    if (config.permitted_calls_in_half_open_state < 1) {
        Log::warn("CircuitBreakerConfigurator", "half-open permitted calls out of range, using default");
        config.permitted_calls_in_half_open_state = defaults.permitted_calls_in_half_open_state;
    }

    return config;
}

// EnvConfig implementation
std::optional<SystemLogLevel> EnvConfig::get_log_level() {
    auto level_str = get_env("SQLTELEMETRY_LOG_LEVEL");
    if (!level_str) {
        return std::nullopt;
    }

    std::string level = Utils::to_upper(Utils::trim(*level_str));

    if (level == "NONE") return SystemLogLevel::NONE;
    if (level == "ERROR") return SystemLogLevel::ERROR;
    if (level == "WARN") return SystemLogLevel::WARN;
    if (level == "INFO") return SystemLogLevel::INFO;
    if (level == "DEBUG") return SystemLogLevel::DEBUG;
    if (level == "TRACE") return SystemLogLevel::TRACE;

    return std::nullopt;
}

std::optional<size_t> EnvConfig::get_thread_pool_size() {
    auto size = get_env_int("SQLTELEMETRY_THREAD_POOL_SIZE");
    if (size && *size > 0) {
        return static_cast<size_t>(*size);
    }
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> EnvConfig::get_flush_interval() {
    auto interval = get_env_int("SQLTELEMETRY_FLUSH_INTERVAL_MS");
    if (interval && *interval >= 0) {
        return std::chrono::milliseconds(*interval);
    }
    return std::nullopt;
}

std::optional<std::string> EnvConfig::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::make_optional(std::string(value)) : std::nullopt;
}

std::optional<int> EnvConfig::get_env_int(const std::string& name) {
    auto str_value = get_env(name);
    if (!str_value) {
        return std::nullopt;
    }

    try {
        return std::stoi(*str_value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace sqltelemetry
