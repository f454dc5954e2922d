// include/sqltelemetry/client_factory.hpp
// Purpose: Registry of telemetry clients keyed by connection and auth mode
// Owns the shared worker pool, the per-host push breakers and the flush timer

#pragma once

#include "config.hpp"
#include "push.hpp"
#include "telemetry_client.hpp"
#include "worker_pool.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace sqltelemetry {

// Resolves credentials for a connection. std::nullopt or an exception means
// the connection gets an unauthenticated client.
using AuthResolver = std::function<std::optional<AuthConfig>(const ConnectionContext& context)>;

// Applied to every client the registry builds, after the breaker decorator.
// A null result keeps the undecorated client.
using ClientDecorator = std::function<std::shared_ptr<ITelemetryClient>(
    std::shared_ptr<ITelemetryClient> client, const PushTarget& target)>;

class TelemetryClientFactory {
public:
    // Process-wide registry configured from the environment
    static TelemetryClientFactory& instance();

    // Isolated registry. Null collaborators are replaced by defaults: a pool sized
    // from config, a resolver that finds no credentials, and TcpTelemetryPushClient.
    explicit TelemetryClientFactory(const TelemetryConfig& config,
                                    AuthResolver auth_resolver = nullptr,
                                    PushClientProvider push_client_provider = nullptr,
                                    std::shared_ptr<WorkerPool> workers = nullptr,
                                    ClientDecorator client_decorator = nullptr);
    ~TelemetryClientFactory();

    TelemetryClientFactory(const TelemetryClientFactory&) = delete;
    TelemetryClientFactory& operator=(const TelemetryClientFactory&) = delete;

    // At most one live client per (connection id, auth mode)
    std::shared_ptr<ITelemetryClient> get_client(const ConnectionContext& context);

    // Removes and closes both entries for the connection. Idempotent; a failing
    // close is logged and does not stop the other entry from closing.
    void close_client(const ConnectionContext& context);

    // Closes and forgets every client
    void reset();

    // Flushes every live client; driven by the flush timer
    void flush_all();

    size_t authenticated_client_count() const;
    size_t unauthenticated_client_count() const;

    const TelemetryConfig& config() const;
    std::shared_ptr<WorkerPool> workers() const;
    std::shared_ptr<CircuitBreakerRegistry> push_breakers() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace sqltelemetry
