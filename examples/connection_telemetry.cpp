// connection_telemetry.cpp
// Connection Telemetry Example
// Shows per-connection telemetry clients with circuit breaker protection

#include <iostream>
#include <chrono>
#include <thread>
#include "sqltelemetry/sqltelemetry.hpp"

using namespace sqltelemetry;

int main() {
    std::cout << "📡 sqltelemetry " << version() << " - Connection Telemetry\n" << std::endl;

    try {
        TelemetryConfig config;
        config.thread_pool_size = 2;
        config.flush_interval = std::chrono::milliseconds(1000);
        config.network.max_retries = 1;
        config.log_level = SystemLogLevel::INFO;
        Log::set_level(config.log_level);

        // Collector endpoint comes from the connection's host URL
        AuthResolver resolver = [](const ConnectionContext& context) -> std::optional<AuthConfig> {
            return AuthConfig{context.host_url(), "example-token"};
        };
        TelemetryClientFactory factory(config, resolver);

        PropertiesConnectionContext context("conn-1", "localhost:50001", {
            {PropertyKeys::TELEMETRY_BATCH_SIZE, "10"},
            {PropertyKeys::CIRCUIT_BREAKER_MIN_CALLS, "5"},
            {PropertyKeys::CIRCUIT_BREAKER_WINDOW_SIZE, "10"},
            {PropertyKeys::CIRCUIT_BREAKER_WAIT_DURATION, "5"}
        });

        auto client = factory.get_client(context);
        std::cout << "✅ Telemetry client ready for connection " << context.connection_id() << std::endl;

        for (int i = 0; i < 25; ++i) {
            client->export_event(TelemetryEvent(EventKinds::LATENCY, {
                {"operation", std::string("execute")},
                {"duration_ms", int64_t(10 + i)}
            }).with_statement_id("stmt-" + std::to_string(i)));
        }

        client->export_event(TelemetryEvent(EventKinds::ERROR, {
            {"message", std::string("Table not found")},
            {"retryable", false}
        }).with_error_code(1146));

        std::cout << "📊 Exported 26 events" << std::endl;

        // Give the flush timer a chance to run
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));

        auto breaker = factory.push_breakers()->find("localhost:50001");
        if (breaker) {
            std::cout << "🔌 Push breaker for localhost:50001 is "
                      << circuit_state_to_string(breaker->get_state()) << std::endl;
        }

        factory.close_client(context);
        factory.workers()->shutdown();
        std::cout << "✅ Connection closed" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
