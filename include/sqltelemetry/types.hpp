// include/sqltelemetry/types.hpp
// Purpose: Core value types for the sqltelemetry export pipeline
// Events produced by driver internals and the batch request handed to the transport

#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>

namespace sqltelemetry {

// Type aliases for clarity
using Timestamp = uint64_t;
using ConnectionId = std::string;
using HostUrl = std::string;

// Payload values; nullptr marks a field that must be left out of the serialized event
using PropertyValue = std::variant<
    std::string,
    int64_t,
    double,
    bool,
    std::nullptr_t
>;

class Properties {
public:
    using Container = std::unordered_map<std::string, PropertyValue>;
    using iterator = Container::iterator;
    using const_iterator = Container::const_iterator;

    Properties() = default;
    Properties(std::initializer_list<std::pair<const std::string, PropertyValue>> init)
        : data_(init) {}

    // Element access
    PropertyValue& operator[](const std::string& key) { return data_[key]; }
    const PropertyValue& at(const std::string& key) const { return data_.at(key); }

    // Iterators
    iterator begin() { return data_.begin(); }
    const_iterator begin() const { return data_.begin(); }
    iterator end() { return data_.end(); }
    const_iterator end() const { return data_.end(); }

    // Capacity
    bool empty() const { return data_.empty(); }
    size_t size() const { return data_.size(); }

    bool contains(const std::string& key) const {
        return data_.find(key) != data_.end();
    }

private:
    Container data_;
};

// Well-known event kinds emitted by the driver
namespace EventKinds {
    constexpr const char* ERROR = "error";
    constexpr const char* LATENCY = "latency";
    constexpr const char* USAGE = "usage";
    constexpr const char* CONNECTION = "connection";
}

// One telemetry occurrence. Immutable once built; the queue owns it until drained.
class TelemetryEvent {
public:
    TelemetryEvent(std::string kind, Properties payload);
    TelemetryEvent(std::string kind, Properties payload, Timestamp timestamp);

    const std::string& kind() const { return kind_; }
    Timestamp timestamp() const { return timestamp_; }
    const Properties& payload() const { return payload_; }

    const std::optional<std::string>& statement_id() const { return statement_id_; }
    const std::optional<std::string>& session_id() const { return session_id_; }
    const std::optional<int64_t>& error_code() const { return error_code_; }

    // Builders return a modified copy so a published event is never mutated
    TelemetryEvent with_statement_id(std::string id) const;
    TelemetryEvent with_session_id(std::string id) const;
    TelemetryEvent with_error_code(int64_t code) const;

private:
    std::string kind_;
    Timestamp timestamp_;
    Properties payload_;
    std::optional<std::string> statement_id_;
    std::optional<std::string> session_id_;
    std::optional<int64_t> error_code_;
};

// Batch artifact handed to the push client
struct TelemetryRequest {
    int64_t upload_time_millis = 0;
    std::vector<std::string> proto_logs;
};

// Authentication mode of a telemetry client
enum class AuthMode : uint8_t {
    AUTHENTICATED = 0,
    UNAUTHENTICATED = 1
};

// Credentials resolved for a connection (external collaborator output)
struct AuthConfig {
    HostUrl host;
    std::string token;
};

namespace Utils {

inline Timestamp now_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string auth_mode_to_string(AuthMode mode);

} // namespace Utils

} // namespace sqltelemetry
