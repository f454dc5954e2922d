// src/types.cpp
// Implementation of telemetry event helpers

#include "sqltelemetry/types.hpp"
#include <utility>

namespace sqltelemetry {

TelemetryEvent::TelemetryEvent(std::string kind, Properties payload)
    : TelemetryEvent(std::move(kind), std::move(payload), Utils::now_milliseconds()) {}

TelemetryEvent::TelemetryEvent(std::string kind, Properties payload, Timestamp timestamp)
    : kind_(std::move(kind)), timestamp_(timestamp), payload_(std::move(payload)) {}

TelemetryEvent TelemetryEvent::with_statement_id(std::string id) const {
    TelemetryEvent copy = *this;
    copy.statement_id_ = std::move(id);
    return copy;
}

TelemetryEvent TelemetryEvent::with_session_id(std::string id) const {
    TelemetryEvent copy = *this;
    copy.session_id_ = std::move(id);
    return copy;
}

TelemetryEvent TelemetryEvent::with_error_code(int64_t code) const {
    TelemetryEvent copy = *this;
    copy.error_code_ = code;
    return copy;
}

namespace Utils {

std::string auth_mode_to_string(AuthMode mode) {
    switch (mode) {
        case AuthMode::AUTHENTICATED: return "authenticated";
        case AuthMode::UNAUTHENTICATED: return "unauthenticated";
        default: return "unknown";
    }
}

} // namespace Utils
} // namespace sqltelemetry
