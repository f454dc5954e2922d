// src/telemetry_client.cpp
// Implementation of the queueing telemetry client and its decorators

#include "sqltelemetry/telemetry_client.hpp"
#include "sqltelemetry/errors.hpp"
#include "sqltelemetry/logging.hpp"
#include <atomic>
#include <mutex>
#include <vector>

namespace sqltelemetry {

//=============================================================================
// TelemetryClient Implementation
//=============================================================================

class TelemetryClient::Impl {
public:
    Impl(PushTarget target, size_t batch_size,
         std::optional<CircuitBreakerConfig> push_breaker_config,
         std::shared_ptr<WorkerPool> workers, PushClientProvider provider,
         std::shared_ptr<CircuitBreakerRegistry> push_breakers)
        : target_(std::move(target)),
          batch_size_(batch_size == 0 ? PropertiesConnectionContext::DEFAULT_BATCH_SIZE : batch_size),
          push_breaker_config_(std::move(push_breaker_config)),
          workers_(std::move(workers)), provider_(std::move(provider)),
          push_breakers_(std::move(push_breakers)), closed_(false) {
        if (!workers_) {
            throw Errors::null_reference("workers");
        }
        events_.reserve(batch_size_);
    }

    void export_event(const TelemetryEvent& event) {
        std::vector<TelemetryEvent> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                Log::debug("TelemetryClient", "Client for connection '" + target_.connection_id +
                           "' is closed, dropping telemetry event");
                return;
            }

            events_.push_back(event);
            if (events_.size() >= batch_size_) {
                ready.swap(events_);
                events_.reserve(batch_size_);
            }
        }

        if (!ready.empty()) {
            submit(std::move(ready));
        }
    }

    void flush() {
        std::vector<TelemetryEvent> ready = drain();
        if (!ready.empty()) {
            submit(std::move(ready));
        }
    }

    void close() {
        std::vector<TelemetryEvent> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            ready.swap(events_);
        }

        if (!ready.empty()) {
            submit(std::move(ready));
        }
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t pending_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    size_t batch_size() const { return batch_size_; }
    const PushTarget& target() const { return target_; }

private:
    std::vector<TelemetryEvent> drain() {
        std::vector<TelemetryEvent> snapshot;
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.swap(events_);
        return snapshot;
    }

    void submit(std::vector<TelemetryEvent> snapshot) {
        const size_t count = snapshot.size();
        auto task = std::make_shared<TelemetryPushTask>(std::move(snapshot), target_,
                                                        push_breaker_config_, provider_,
                                                        push_breakers_);
        try {
            workers_->submit([task]() {
                task->run();
            });
        } catch (const ClientError& e) {
            Log::warn("TelemetryClient", "Dropping " + std::to_string(count) +
                      " telemetry events for connection '" + target_.connection_id +
                      "': " + e.what());
        }
    }

    PushTarget target_;
    size_t batch_size_;
    std::optional<CircuitBreakerConfig> push_breaker_config_;
    std::shared_ptr<WorkerPool> workers_;
    PushClientProvider provider_;
    std::shared_ptr<CircuitBreakerRegistry> push_breakers_;

    mutable std::mutex mutex_;
    std::vector<TelemetryEvent> events_;
    bool closed_;
};

TelemetryClient::TelemetryClient(PushTarget target, size_t batch_size,
                                 std::optional<CircuitBreakerConfig> push_breaker_config,
                                 std::shared_ptr<WorkerPool> workers,
                                 PushClientProvider provider,
                                 std::shared_ptr<CircuitBreakerRegistry> push_breakers)
    : pimpl_(std::make_unique<Impl>(std::move(target), batch_size,
                                    std::move(push_breaker_config), std::move(workers),
                                    std::move(provider), std::move(push_breakers))) {}

TelemetryClient::~TelemetryClient() = default;

void TelemetryClient::export_event(const TelemetryEvent& event) {
    try {
        pimpl_->export_event(event);
    } catch (const std::exception& e) {
        Log::error("TelemetryClient", std::string("Failed to export telemetry event: ") + e.what());
    } catch (...) {
        Log::error("TelemetryClient", "Failed to export telemetry event: unknown exception");
    }
}

void TelemetryClient::flush() { pimpl_->flush(); }
void TelemetryClient::close() { pimpl_->close(); }
bool TelemetryClient::is_closed() const { return pimpl_->is_closed(); }
size_t TelemetryClient::pending_events() const { return pimpl_->pending_events(); }
size_t TelemetryClient::batch_size() const { return pimpl_->batch_size(); }
const PushTarget& TelemetryClient::target() const { return pimpl_->target(); }

//=============================================================================
// CircuitBreakerTelemetryClient Implementation
//=============================================================================

CircuitBreakerTelemetryClient::CircuitBreakerTelemetryClient(
    std::shared_ptr<ITelemetryClient> delegate,
    const CircuitBreakerConfig& config,
    std::string name,
    FailureClassifier classifier,
    CircuitBreaker::Clock clock)
    : delegate_(std::move(delegate)),
      breaker_(std::make_shared<CircuitBreaker>(std::move(name), config,
                                                std::move(classifier), std::move(clock))) {
    if (!delegate_) {
        throw Errors::null_reference("delegate");
    }

    listener_id_ = breaker_->add_state_listener(
        [](CircuitBreaker::State from, CircuitBreaker::State to) {
            Log::info("CircuitBreakerTelemetryClient",
                      "Telemetry circuit breaker state changed from " +
                      circuit_state_to_string(from) + " to " + circuit_state_to_string(to));
        });
}

CircuitBreakerTelemetryClient::~CircuitBreakerTelemetryClient() {
    release_listener();
}

void CircuitBreakerTelemetryClient::export_event(const TelemetryEvent& event) {
    try {
        auto permission = breaker_->execute([this, &event]() {
            delegate_->export_event(event);
        });
        if (permission == CallPermission::REJECTED) {
            Log::debug("CircuitBreakerTelemetryClient",
                       "Circuit breaker '" + breaker_->name() + "' rejected telemetry export");
        }
    } catch (const std::exception& e) {
        Log::debug("CircuitBreakerTelemetryClient",
                   std::string("Telemetry export failed: ") + e.what());
    } catch (...) {
        Log::debug("CircuitBreakerTelemetryClient",
                   "Telemetry export failed with a non-standard exception");
    }

    if (breaker_->get_state() == CircuitBreaker::State::OPEN) {
        Log::warn("CircuitBreakerTelemetryClient",
                  "Telemetry circuit breaker is OPEN - telemetry events are being dropped");
    }
}

void CircuitBreakerTelemetryClient::flush() {
    try {
        delegate_->flush();
    } catch (const std::exception& e) {
        Log::debug("CircuitBreakerTelemetryClient", std::string("Telemetry flush failed: ") + e.what());
    } catch (...) {
        Log::debug("CircuitBreakerTelemetryClient", "Telemetry flush failed with an unknown exception");
    }
}

void CircuitBreakerTelemetryClient::close() {
    try {
        delegate_->close();
    } catch (...) {
        release_listener();
        throw;
    }
    release_listener();
}

void CircuitBreakerTelemetryClient::release_listener() {
    if (listener_id_) {
        breaker_->remove_state_listener(*listener_id_);
        listener_id_.reset();
    }
}

CircuitBreaker::State CircuitBreakerTelemetryClient::circuit_breaker_state() const {
    return breaker_->get_state();
}

CircuitBreaker::Metrics CircuitBreakerTelemetryClient::circuit_breaker_metrics() const {
    return breaker_->metrics();
}

//=============================================================================
// NoopTelemetryClient Implementation
//=============================================================================

std::shared_ptr<NoopTelemetryClient> NoopTelemetryClient::instance() {
    static std::shared_ptr<NoopTelemetryClient> client = std::make_shared<NoopTelemetryClient>();
    return client;
}

} // namespace sqltelemetry
