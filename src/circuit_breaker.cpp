// src/circuit_breaker.cpp
// Implementation of the sliding-window circuit breaker and its registry

#include "sqltelemetry/circuit_breaker.hpp"
#include "sqltelemetry/logging.hpp"
#include <algorithm>
#include <new>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sqltelemetry {

//=============================================================================
// FailureClassifier Implementation
//=============================================================================

FailureClassifier& FailureClassifier::record_if(Predicate predicate) {
    record_rules_.push_back(std::move(predicate));
    return *this;
}

FailureClassifier& FailureClassifier::ignore_if(Predicate predicate) {
    ignore_rules_.push_back(std::move(predicate));
    return *this;
}

FailureClassification FailureClassifier::classify(const std::exception& e) const {
    for (const auto& rule : ignore_rules_) {
        if (rule(e)) {
            return FailureClassification::IGNORED;
        }
    }
    for (const auto& rule : record_rules_) {
        if (rule(e)) {
            return FailureClassification::RECORDED;
        }
    }
    return FailureClassification::UNCLASSIFIED;
}

bool FailureClassifier::should_record(const std::exception& e) const {
    return classify(e) != FailureClassification::IGNORED;
}

FailureClassifier default_telemetry_classifier() {
    FailureClassifier classifier;
    classifier.record<NetworkError>()
              .record<TimeoutError>()
              .record<ServerError>()
              .record<SystemError>()
              .record<std::bad_alloc>()
              .record<std::system_error>()
              .record_if([](const std::exception& e) {
                  auto* client_error = dynamic_cast<const ClientError*>(&e);
                  return client_error != nullptr &&
                         client_error->code() == ErrorCode::TASK_REJECTED;
              })
              .ignore<ValidationError>()
              .ignore<std::invalid_argument>();
    return classifier;
}

//=============================================================================
// CircuitBreaker Implementation
//=============================================================================

CircuitBreaker::CircuitBreaker(std::string name,
                               const CircuitBreakerConfig& config,
                               FailureClassifier classifier,
                               Clock clock)
    : name_(std::move(name)), config_(config), classifier_(std::move(classifier)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      state_(State::CLOSED), epoch_(0), window_(), window_head_(0), buffered_calls_(0), failed_calls_(0),
      opened_at_(), not_permitted_calls_(0),
      half_open_issued_(0), half_open_completed_(0), half_open_failures_(0),
      next_listener_id_(1) {
    config_.validate();
    window_.assign(static_cast<size_t>(config_.sliding_window_size), false);
}

std::optional<CircuitBreaker::Permit> CircuitBreaker::try_acquire_permission() {
    std::vector<Transition> transitions;
    bool allowed = false;
    Permit permit;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == State::OPEN) {
            if (clock_() - opened_at_ >= config_.wait_duration_in_open_state) {
                transition_to(State::HALF_OPEN, transitions);
            }
        }

        switch (state_) {
            case State::CLOSED:
                allowed = true;
                break;
            case State::OPEN:
                allowed = false;
                break;
            case State::HALF_OPEN:
                if (half_open_issued_ < config_.permitted_calls_in_half_open_state) {
                    half_open_issued_++;
                    allowed = true;
                }
                break;
        }

        if (allowed) {
            permit.epoch = epoch_;
        } else {
            not_permitted_calls_++;
        }
    }

    notify(transitions);
    if (!allowed) {
        return std::nullopt;
    }
    return permit;
}

void CircuitBreaker::record_success(const Permit& permit) {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_result(false, permit, transitions);
    }
    notify(transitions);
}

void CircuitBreaker::record_failure(const Permit& permit) {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_result(true, permit, transitions);
    }
    notify(transitions);
}

void CircuitBreaker::record_ignored(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (permit.epoch != epoch_) {
        return;
    }
    // Releases a half-open permit without counting the call
    if (state_ == State::HALF_OPEN && half_open_issued_ > half_open_completed_) {
        half_open_issued_--;
    }
}

void CircuitBreaker::on_result(bool failed, const Permit& permit,
                               std::vector<Transition>& transitions) {
    // Outcome of a call permitted in an earlier state period
    if (permit.epoch != epoch_) {
        return;
    }

    switch (state_) {
        case State::CLOSED:
            record_in_window(failed);
            if (window_ready() && window_failure_rate() >= config_.failure_rate_threshold) {
                transition_to(State::OPEN, transitions);
            }
            break;

        case State::OPEN:
            break;

        case State::HALF_OPEN:
            if (half_open_completed_ >= half_open_issued_) {
                break;
            }
            half_open_completed_++;
            if (failed) {
                half_open_failures_++;
            }
            if (half_open_completed_ >= config_.permitted_calls_in_half_open_state) {
                float rate = 100.0f * static_cast<float>(half_open_failures_) /
                             static_cast<float>(half_open_completed_);
                transition_to(rate < config_.failure_rate_threshold ? State::CLOSED : State::OPEN,
                              transitions);
            }
            break;
    }
}

void CircuitBreaker::record_in_window(bool failed) {
    const size_t capacity = window_.size();

    if (buffered_calls_ == static_cast<int>(capacity)) {
        if (window_[window_head_]) {
            failed_calls_--;
        }
    } else {
        buffered_calls_++;
    }

    window_[window_head_] = failed;
    if (failed) {
        failed_calls_++;
    }
    window_head_ = (window_head_ + 1) % capacity;
}

void CircuitBreaker::clear_window() {
    std::fill(window_.begin(), window_.end(), false);
    window_head_ = 0;
    buffered_calls_ = 0;
    failed_calls_ = 0;
}

bool CircuitBreaker::window_ready() const {
    return buffered_calls_ >= std::min(config_.minimum_number_of_calls, config_.sliding_window_size);
}

float CircuitBreaker::window_failure_rate() const {
    if (buffered_calls_ == 0) {
        return 0.0f;
    }
    return 100.0f * static_cast<float>(failed_calls_) / static_cast<float>(buffered_calls_);
}

void CircuitBreaker::transition_to(State next, std::vector<Transition>& transitions) {
    if (next == state_) {
        return;
    }

    State previous = state_;
    state_ = next;
    epoch_++;

    switch (next) {
        case State::OPEN:
            opened_at_ = clock_();
            break;
        case State::HALF_OPEN:
            half_open_issued_ = 0;
            half_open_completed_ = 0;
            half_open_failures_ = 0;
            break;
        case State::CLOSED:
            clear_window();
            break;
    }

    transitions.emplace_back(previous, next);
}

void CircuitBreaker::notify(const std::vector<Transition>& transitions) {
    if (transitions.empty()) {
        return;
    }

    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto& transition : transitions) {
        Log::info("CircuitBreaker", "'" + name_ + "' " +
                   circuit_state_to_string(transition.first) + " -> " +
                   circuit_state_to_string(transition.second));
        for (const auto& listener : listeners) {
            try {
                listener(transition.first, transition.second);
            } catch (const std::exception& e) {
                Log::warn("CircuitBreaker", "State listener failed for '" + name_ + "': " + e.what());
            }
        }
    }
}

CircuitBreaker::State CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Metrics CircuitBreaker::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Metrics result;
    result.failed_calls = failed_calls_;
    result.successful_calls = buffered_calls_ - failed_calls_;
    result.buffered_calls = buffered_calls_;
    result.not_permitted_calls = not_permitted_calls_;
    result.failure_rate = window_ready() ? window_failure_rate() : -1.0f;
    return result;
}

void CircuitBreaker::reset() {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition_to(State::CLOSED, transitions);
        epoch_++;
        clear_window();
        not_permitted_calls_ = 0;
        half_open_issued_ = 0;
        half_open_completed_ = 0;
        half_open_failures_ = 0;
    }
    notify(transitions);
}

CircuitBreaker::ListenerId CircuitBreaker::add_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void CircuitBreaker::remove_state_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(id);
}

std::string circuit_state_to_string(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::CLOSED: return "CLOSED";
        case CircuitBreaker::State::OPEN: return "OPEN";
        case CircuitBreaker::State::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

//=============================================================================
// CircuitBreakerRegistry Implementation
//=============================================================================

CircuitBreakerRegistry::CircuitBreakerRegistry(FailureClassifier classifier,
                                               CircuitBreaker::Clock clock)
    : classifier_(std::move(classifier)), clock_(std::move(clock)) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_or_create(
    const std::string& name, const CircuitBreakerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(name, config, classifier_, clock_);
    breakers_.emplace(name, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

bool CircuitBreakerRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.erase(name) > 0;
}

void CircuitBreakerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    breakers_.clear();
}

size_t CircuitBreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace sqltelemetry
