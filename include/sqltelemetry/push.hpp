// include/sqltelemetry/push.hpp
// Purpose: Push side of the pipeline
// Push client contract, per-host breaker decorator, event serialization and the push task

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "circuit_breaker.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqltelemetry {

// Transport contract: delivers one TelemetryRequest. May throw the Error taxonomy.
class ITelemetryPushClient {
public:
    virtual ~ITelemetryPushClient() = default;
    virtual void push_event(const TelemetryRequest& request) = 0;
};

// Everything a provider needs to build a push client for one connection
struct PushTarget {
    HostUrl host;
    ConnectionId connection_id;
    AuthMode auth_mode = AuthMode::UNAUTHENTICATED;
    std::optional<AuthConfig> auth;
};

using PushClientProvider =
    std::function<std::unique_ptr<ITelemetryPushClient>(const PushTarget& target)>;

// Guards a push client with the host's shared breaker.
// Throws ClientError(CIRCUIT_OPEN) when the breaker rejects the push.
class CircuitBreakerTelemetryPushClient : public ITelemetryPushClient {
public:
    CircuitBreakerTelemetryPushClient(std::unique_ptr<ITelemetryPushClient> delegate,
                                      std::shared_ptr<CircuitBreaker> breaker);

    void push_event(const TelemetryRequest& request) override;

    const CircuitBreaker& circuit_breaker() const { return *breaker_; }

private:
    std::unique_ptr<ITelemetryPushClient> delegate_;
    std::shared_ptr<CircuitBreaker> breaker_;
};

namespace EventSerializer {

// One event as a JSON object. Null payload values and unset optional fields are omitted.
// Throws ProtocolError(SERIALIZATION_FAILED), e.g. on invalid UTF-8.
std::string to_json(const TelemetryEvent& event);

} // namespace EventSerializer

// One-shot unit of work: serializes a drained snapshot and pushes it.
// run() never throws for std::exception.
class TelemetryPushTask {
public:
    TelemetryPushTask(std::vector<TelemetryEvent> events,
                      PushTarget target,
                      std::optional<CircuitBreakerConfig> breaker_config,
                      PushClientProvider provider,
                      std::shared_ptr<CircuitBreakerRegistry> breakers);

    void run();
    void operator()() { run(); }

    // Serializes every event independently; events that fail are logged and left out
    TelemetryRequest build_request() const;

    size_t size() const { return events_.size(); }

private:
    std::vector<TelemetryEvent> events_;
    PushTarget target_;
    std::optional<CircuitBreakerConfig> breaker_config_;
    PushClientProvider provider_;
    std::shared_ptr<CircuitBreakerRegistry> breakers_;
};

} // namespace sqltelemetry
