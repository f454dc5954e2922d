// src/push.cpp
// Implementation of event serialization, the push-level breaker and the push task

#include "sqltelemetry/push.hpp"
#include "sqltelemetry/errors.hpp"
#include "sqltelemetry/logging.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>
#include <variant>

namespace sqltelemetry {

//=============================================================================
// CircuitBreakerTelemetryPushClient Implementation
//=============================================================================

CircuitBreakerTelemetryPushClient::CircuitBreakerTelemetryPushClient(
    std::unique_ptr<ITelemetryPushClient> delegate,
    std::shared_ptr<CircuitBreaker> breaker)
    : delegate_(std::move(delegate)), breaker_(std::move(breaker)) {
    if (!delegate_) {
        throw Errors::null_reference("delegate");
    }
    if (!breaker_) {
        throw Errors::null_reference("breaker");
    }
}

void CircuitBreakerTelemetryPushClient::push_event(const TelemetryRequest& request) {
    auto permission = breaker_->execute([this, &request]() {
        delegate_->push_event(request);
    });

    if (permission == CallPermission::REJECTED) {
        throw Errors::circuit_open(breaker_->name());
    }
}

//=============================================================================
// EventSerializer Implementation
//=============================================================================

namespace EventSerializer {

namespace {

nlohmann::json payload_to_json(const Properties& payload) {
    nlohmann::json json_obj = nlohmann::json::object();

    for (const auto& [key, value] : payload) {
        std::visit([&json_obj, &key](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                json_obj[key] = v;
            } else if constexpr (std::is_same_v<T, int64_t>) {
                json_obj[key] = v;
            } else if constexpr (std::is_same_v<T, double>) {
                json_obj[key] = v;
            } else if constexpr (std::is_same_v<T, bool>) {
                json_obj[key] = v;
            }
            // nullptr values are omitted
        }, value);
    }

    return json_obj;
}

} // namespace

std::string to_json(const TelemetryEvent& event) {
    nlohmann::json json_obj;
    json_obj["kind"] = event.kind();
    json_obj["timestamp"] = event.timestamp();

    if (!event.payload().empty()) {
        json_obj["payload"] = payload_to_json(event.payload());
    }
    if (event.statement_id()) {
        json_obj["statement_id"] = *event.statement_id();
    }
    if (event.session_id()) {
        json_obj["session_id"] = *event.session_id();
    }
    if (event.error_code()) {
        json_obj["error_code"] = *event.error_code();
    }

    try {
        return json_obj.dump();
    } catch (const nlohmann::json::exception& e) {
        throw Errors::serialization_failed("TelemetryEvent", e.what());
    }
}

} // namespace EventSerializer

//=============================================================================
// TelemetryPushTask Implementation
//=============================================================================

TelemetryPushTask::TelemetryPushTask(std::vector<TelemetryEvent> events,
                                     PushTarget target,
                                     std::optional<CircuitBreakerConfig> breaker_config,
                                     PushClientProvider provider,
                                     std::shared_ptr<CircuitBreakerRegistry> breakers)
    : events_(std::move(events)), target_(std::move(target)),
      breaker_config_(std::move(breaker_config)), provider_(std::move(provider)),
      breakers_(std::move(breakers)) {}

TelemetryRequest TelemetryPushTask::build_request() const {
    TelemetryRequest request;
    request.upload_time_millis = static_cast<int64_t>(Utils::now_milliseconds());
    request.proto_logs.reserve(events_.size());

    for (const auto& event : events_) {
        try {
            request.proto_logs.push_back(EventSerializer::to_json(event));
        } catch (const ProtocolError& e) {
            Log::error("TelemetryPushTask", "Failed to serialize telemetry event of kind '" +
                       event.kind() + "': " + e.what());
        }
    }

    return request;
}

void TelemetryPushTask::run() {
    Log::debug("TelemetryPushTask", "Pushing telemetry logs of size " +
               std::to_string(events_.size()));
    if (events_.empty()) {
        return;
    }

    try {
        TelemetryRequest request = build_request();

        if (!provider_) {
            throw Errors::null_reference("push client provider");
        }
        std::unique_ptr<ITelemetryPushClient> push_client = provider_(target_);
        if (!push_client) {
            throw Errors::null_reference("push client");
        }

        if (breaker_config_ && breakers_) {
            auto breaker = breakers_->get_or_create(target_.host, *breaker_config_);
            push_client = std::make_unique<CircuitBreakerTelemetryPushClient>(
                std::move(push_client), std::move(breaker));
        }

        push_client->push_event(request);
    } catch (const std::exception& e) {
        // Delivery is best-effort; the transport owns retries
        Log::trace("TelemetryPushTask", std::string("Failed to push telemetry logs: ") + e.what());
    } catch (...) {
        Log::trace("TelemetryPushTask", "Failed to push telemetry logs: unknown exception");
    }
}

} // namespace sqltelemetry
