// include/sqltelemetry/telemetry_client.hpp
// Purpose: Per-connection telemetry clients
// Queueing client, circuit breaker decorator and the no-op client

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "circuit_breaker.hpp"
#include "push.hpp"
#include "worker_pool.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sqltelemetry {

// Narrow client interface seen by driver code
class ITelemetryClient {
public:
    virtual ~ITelemetryClient() = default;

    // Hands one event to the pipeline. Does not block on I/O and does not throw.
    virtual void export_event(const TelemetryEvent& event) = 0;

    // Submits whatever is queued to the push workers
    virtual void flush() = 0;

    virtual void close() = 0;
};

// Buffers events for one (connection, auth mode) and ships them as push tasks
// on the shared worker pool when the batch fills, on flush() and on close().
class TelemetryClient : public ITelemetryClient {
public:
    TelemetryClient(PushTarget target,
                    size_t batch_size,
                    std::optional<CircuitBreakerConfig> push_breaker_config,
                    std::shared_ptr<WorkerPool> workers,
                    PushClientProvider provider,
                    std::shared_ptr<CircuitBreakerRegistry> push_breakers);
    ~TelemetryClient() override;

    TelemetryClient(const TelemetryClient&) = delete;
    TelemetryClient& operator=(const TelemetryClient&) = delete;

    void export_event(const TelemetryEvent& event) override;
    void flush() override;
    void close() override;

    bool is_closed() const;
    size_t pending_events() const;
    size_t batch_size() const;
    const PushTarget& target() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Guards a delegate client with its own breaker. export_event never throws;
// close() propagates a delegate failure after releasing the breaker listeners.
class CircuitBreakerTelemetryClient : public ITelemetryClient {
public:
    CircuitBreakerTelemetryClient(std::shared_ptr<ITelemetryClient> delegate,
                                  const CircuitBreakerConfig& config,
                                  std::string name = "telemetry-client",
                                  FailureClassifier classifier = default_telemetry_classifier(),
                                  CircuitBreaker::Clock clock = nullptr);
    ~CircuitBreakerTelemetryClient() override;

    void export_event(const TelemetryEvent& event) override;
    void flush() override;
    void close() override;

    CircuitBreaker::State circuit_breaker_state() const;
    CircuitBreaker::Metrics circuit_breaker_metrics() const;
    const std::shared_ptr<ITelemetryClient>& delegate() const { return delegate_; }

private:
    void release_listener();

    std::shared_ptr<ITelemetryClient> delegate_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::optional<CircuitBreaker::ListenerId> listener_id_;
};

// Returned when telemetry is disabled for a connection
class NoopTelemetryClient : public ITelemetryClient {
public:
    static std::shared_ptr<NoopTelemetryClient> instance();

    void export_event(const TelemetryEvent&) override {}
    void flush() override {}
    void close() override {}
};

} // namespace sqltelemetry
