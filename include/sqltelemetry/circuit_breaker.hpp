// include/sqltelemetry/circuit_breaker.hpp
// Purpose: Count-based circuit breaker guarding telemetry pushes to a host
// Sliding-window failure rate, timed OPEN state, bounded HALF_OPEN probing

#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqltelemetry {

enum class FailureClassification {
    RECORDED,      // Matches a record rule; counts as a failure
    IGNORED,       // Matches an ignore rule; counts as neither success nor failure
    UNCLASSIFIED   // Matches neither list; counts as a failure
};

// Decides which escaped exceptions count as failures.
// Ignore rules win over record rules; an exception matching neither counts as a failure.
class FailureClassifier {
public:
    using Predicate = std::function<bool(const std::exception&)>;

    template <typename E>
    FailureClassifier& record() {
        record_rules_.push_back([](const std::exception& e) {
            return dynamic_cast<const E*>(&e) != nullptr;
        });
        return *this;
    }

    template <typename E>
    FailureClassifier& ignore() {
        ignore_rules_.push_back([](const std::exception& e) {
            return dynamic_cast<const E*>(&e) != nullptr;
        });
        return *this;
    }

    FailureClassifier& record_if(Predicate predicate);
    FailureClassifier& ignore_if(Predicate predicate);

    FailureClassification classify(const std::exception& e) const;
    bool should_record(const std::exception& e) const;

private:
    std::vector<Predicate> record_rules_;
    std::vector<Predicate> ignore_rules_;
};

// Transport, timeout, server, resource and rejected-submission failures are recorded;
// caller errors (ValidationError, std::invalid_argument) are ignored.
FailureClassifier default_telemetry_classifier();

enum class CallPermission {
    PERMITTED,
    REJECTED
};

class CircuitBreaker {
public:
    enum class State {
        CLOSED,    // Normal operation
        OPEN,      // Failing fast
        HALF_OPEN  // Testing if service recovered
    };

    struct Metrics {
        int failed_calls = 0;            // Failures currently in the window
        int successful_calls = 0;        // Successes currently in the window
        int buffered_calls = 0;
        uint64_t not_permitted_calls = 0;
        float failure_rate = -1.0f;      // -1 until enough calls are buffered
    };

    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using StateListener = std::function<void(State from, State to)>;
    using ListenerId = uint64_t;

    // An acquired permission, tagged with the state period it was issued in.
    // Outcomes reported against an earlier period are discarded.
    struct Permit {
        uint64_t epoch = 0;
    };

    CircuitBreaker(std::string name,
                   const CircuitBreakerConfig& config,
                   FailureClassifier classifier = default_telemetry_classifier(),
                   Clock clock = nullptr);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }
    const FailureClassifier& classifier() const { return classifier_; }

    // Acquires a permission. Every permit must be returned through exactly one
    // record_success(), record_failure() or record_ignored().
    std::optional<Permit> try_acquire_permission();
    void record_success(const Permit& permit);
    void record_failure(const Permit& permit);
    void record_ignored(const Permit& permit);

    State get_state() const;
    Metrics metrics() const;
    void reset();

    ListenerId add_state_listener(StateListener listener);
    void remove_state_listener(ListenerId id);

    // Runs op under the breaker. Returns REJECTED without invoking op when the call
    // is not permitted; exceptions from op are classified and rethrown. Exceptions
    // outside both classifier lists are counted as failures and logged at debug.
    template <typename Op>
    CallPermission execute(Op&& op) {
        std::optional<Permit> permit = try_acquire_permission();
        if (!permit) {
            return CallPermission::REJECTED;
        }

        try {
            std::forward<Op>(op)();
        } catch (const std::exception& e) {
            FailureClassification classification = classifier_.classify(e);
            if (classification == FailureClassification::IGNORED) {
                record_ignored(*permit);
            } else {
                if (classification == FailureClassification::UNCLASSIFIED) {
                    Log::debug("CircuitBreaker", "'" + name_ +
                               "' counting unclassified exception as failure: " + e.what());
                }
                record_failure(*permit);
            }
            throw;
        } catch (...) {
            record_failure(*permit);
            throw;
        }
        record_success(*permit);
        return CallPermission::PERMITTED;
    }

private:
    using Transition = std::pair<State, State>;

    void on_result(bool failed, const Permit& permit, std::vector<Transition>& transitions);
    void record_in_window(bool failed);
    void clear_window();
    float window_failure_rate() const;
    bool window_ready() const;
    void transition_to(State next, std::vector<Transition>& transitions);
    void notify(const std::vector<Transition>& transitions);

    std::string name_;
    CircuitBreakerConfig config_;
    FailureClassifier classifier_;
    Clock clock_;

    mutable std::mutex mutex_;
    State state_;
    uint64_t epoch_;  // Advances on every transition and reset

    // Ring buffer of the last sliding_window_size outcomes (true = failure)
    std::vector<bool> window_;
    size_t window_head_;
    int buffered_calls_;
    int failed_calls_;

    std::chrono::steady_clock::time_point opened_at_;
    uint64_t not_permitted_calls_;

    int half_open_issued_;
    int half_open_completed_;
    int half_open_failures_;

    std::mutex listener_mutex_;
    std::unordered_map<ListenerId, StateListener> listeners_;
    ListenerId next_listener_id_;
};

std::string circuit_state_to_string(CircuitBreaker::State state);

// Breakers keyed by name (the push target host); first configuration for a key wins
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(FailureClassifier classifier = default_telemetry_classifier(),
                                    CircuitBreaker::Clock clock = nullptr);

    std::shared_ptr<CircuitBreaker> get_or_create(const std::string& name,
                                                  const CircuitBreakerConfig& config);
    std::shared_ptr<CircuitBreaker> find(const std::string& name) const;
    bool remove(const std::string& name);
    void clear();
    size_t size() const;

private:
    FailureClassifier classifier_;
    CircuitBreaker::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace sqltelemetry
