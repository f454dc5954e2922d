// src/client_factory.cpp
// Implementation of the telemetry client registry and its flush timer

#include "sqltelemetry/client_factory.hpp"
#include "sqltelemetry/errors.hpp"
#include "sqltelemetry/logging.hpp"
#include "sqltelemetry/network.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sqltelemetry {

namespace {

using ClientMap = std::unordered_map<ConnectionId, std::shared_ptr<ITelemetryClient>>;

TelemetryConfig process_config() {
    TelemetryConfig config = TelemetryConfig::from_environment();
    if (!config.is_valid()) {
        for (const auto& error : config.validation_errors()) {
            Log::error("TelemetryClientFactory", error);
        }
        Log::error("TelemetryClientFactory", "Falling back to default telemetry configuration");
        config = TelemetryConfig();
    }
    Log::set_level(config.log_level);
    return config;
}

void close_quietly(const std::shared_ptr<ITelemetryClient>& client, const std::string& client_type) {
    if (!client) {
        return;
    }
    try {
        client->close();
    } catch (const std::exception& e) {
        Log::debug("TelemetryClientFactory", "Caught error while closing " + client_type +
                   ": " + e.what());
    } catch (...) {
        Log::debug("TelemetryClientFactory", "Caught unknown error while closing " + client_type);
    }
}

} // namespace

class TelemetryClientFactory::Impl {
public:
    Impl(const TelemetryConfig& config, AuthResolver auth_resolver,
         PushClientProvider push_client_provider, std::shared_ptr<WorkerPool> workers,
         ClientDecorator client_decorator)
        : config_(config), auth_resolver_(std::move(auth_resolver)),
          push_client_provider_(std::move(push_client_provider)),
          workers_(std::move(workers)),
          client_decorator_(std::move(client_decorator)),
          push_breakers_(std::make_shared<CircuitBreakerRegistry>()),
          running_(false) {
        config_.validate();

        if (!workers_) {
            workers_ = std::make_shared<WorkerPool>(config_.thread_pool_size,
                                                    config_.max_pending_tasks);
        }

        if (!push_client_provider_) {
            NetworkConfig network = config_.network;
            push_client_provider_ = [network](const PushTarget& target) {
                return std::unique_ptr<ITelemetryPushClient>(
                    std::make_unique<TcpTelemetryPushClient>(target, network));
            };
        }

        start_flush_timer();
    }

    ~Impl() {
        stop_flush_timer();
        reset();
    }

    std::shared_ptr<ITelemetryClient> get_client(const ConnectionContext& context) {
        if (!context.is_telemetry_allowed()) {
            return NoopTelemetryClient::instance();
        }

        std::optional<AuthConfig> auth = resolve_auth(context);
        const ConnectionId id = context.connection_id();
        const AuthMode mode = auth ? AuthMode::AUTHENTICATED : AuthMode::UNAUTHENTICATED;

        std::lock_guard<std::mutex> lock(mutex_);
        ClientMap& clients = mode == AuthMode::AUTHENTICATED ? authenticated_ : unauthenticated_;

        auto it = clients.find(id);
        if (it != clients.end()) {
            return it->second;
        }

        auto client = create_client(context, mode, auth);
        clients.emplace(id, client);
        Log::debug("TelemetryClientFactory", "Created " + Utils::auth_mode_to_string(mode) +
                   " telemetry client for connection '" + id + "'");
        return client;
    }

    void close_client(const ConnectionContext& context) {
        std::shared_ptr<ITelemetryClient> authenticated;
        std::shared_ptr<ITelemetryClient> unauthenticated;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            authenticated = take(authenticated_, context.connection_id());
            unauthenticated = take(unauthenticated_, context.connection_id());
        }

        close_quietly(authenticated, "telemetry client");
        close_quietly(unauthenticated, "unauthenticated telemetry client");
    }

    void reset() {
        ClientMap authenticated;
        ClientMap unauthenticated;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            authenticated.swap(authenticated_);
            unauthenticated.swap(unauthenticated_);
        }

        for (const auto& entry : authenticated) {
            close_quietly(entry.second, "telemetry client");
        }
        for (const auto& entry : unauthenticated) {
            close_quietly(entry.second, "unauthenticated telemetry client");
        }
    }

    void flush_all() {
        std::vector<std::shared_ptr<ITelemetryClient>> clients;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            clients.reserve(authenticated_.size() + unauthenticated_.size());
            for (const auto& entry : authenticated_) clients.push_back(entry.second);
            for (const auto& entry : unauthenticated_) clients.push_back(entry.second);
        }

        for (const auto& client : clients) {
            try {
                client->flush();
            } catch (const std::exception& e) {
                Log::debug("TelemetryClientFactory", std::string("Flush failed: ") + e.what());
            } catch (...) {
                Log::debug("TelemetryClientFactory", "Flush failed with an unknown exception");
            }
        }
    }

    size_t authenticated_client_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return authenticated_.size();
    }

    size_t unauthenticated_client_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unauthenticated_.size();
    }

    const TelemetryConfig& config() const { return config_; }
    std::shared_ptr<WorkerPool> workers() const { return workers_; }
    std::shared_ptr<CircuitBreakerRegistry> push_breakers() const { return push_breakers_; }

private:
    std::optional<AuthConfig> resolve_auth(const ConnectionContext& context) const {
        if (!auth_resolver_) {
            return std::nullopt;
        }
        try {
            return auth_resolver_(context);
        } catch (const std::exception& e) {
            Log::debug("TelemetryClientFactory", "Auth resolution failed for connection '" +
                       context.connection_id() + "': " + e.what());
            return std::nullopt;
        }
    }

    std::shared_ptr<ITelemetryClient> create_client(const ConnectionContext& context,
                                                    AuthMode mode,
                                                    const std::optional<AuthConfig>& auth) {
        PushTarget target;
        target.connection_id = context.connection_id();
        target.host = auth && !auth->host.empty() ? auth->host : context.host_url();
        target.auth_mode = mode;
        target.auth = auth;

        std::optional<CircuitBreakerConfig> breaker_config =
            CircuitBreakerConfigurator::create_config(context);

        std::shared_ptr<ITelemetryClient> client =
            std::make_shared<TelemetryClient>(target, context.telemetry_batch_size(),
                                              breaker_config, workers_,
                                              push_client_provider_, push_breakers_);
        if (breaker_config) {
            client = std::make_shared<CircuitBreakerTelemetryClient>(client, *breaker_config);
        }

        if (client_decorator_) {
            if (auto decorated = client_decorator_(client, target)) {
                client = std::move(decorated);
            }
        }
        return client;
    }

    static std::shared_ptr<ITelemetryClient> take(ClientMap& clients, const ConnectionId& id) {
        auto it = clients.find(id);
        if (it == clients.end()) {
            return nullptr;
        }
        auto client = std::move(it->second);
        clients.erase(it);
        return client;
    }

    void start_flush_timer() {
        if (config_.flush_interval.count() <= 0) {
            return;
        }

        running_ = true;
        flush_thread_ = std::thread([this]() {
            flush_timer_thread();
        });
    }

    void stop_flush_timer() {
        {
            std::lock_guard<std::mutex> lock(timer_mutex_);
            if (!running_) return;
            running_ = false;
        }

        timer_condition_.notify_all();

        if (flush_thread_.joinable()) {
            flush_thread_.join();
        }
    }

    void flush_timer_thread() {
        std::unique_lock<std::mutex> lock(timer_mutex_);
        while (running_) {
            if (timer_condition_.wait_for(lock, config_.flush_interval,
                                          [this]() { return !running_; })) {
                break;
            }

            lock.unlock();
            flush_all();
            lock.lock();
        }
    }

    TelemetryConfig config_;
    AuthResolver auth_resolver_;
    PushClientProvider push_client_provider_;
    std::shared_ptr<WorkerPool> workers_;
    ClientDecorator client_decorator_;
    std::shared_ptr<CircuitBreakerRegistry> push_breakers_;

    mutable std::mutex mutex_;
    ClientMap authenticated_;
    ClientMap unauthenticated_;

    std::mutex timer_mutex_;
    std::condition_variable timer_condition_;
    std::thread flush_thread_;
    bool running_;
};

TelemetryClientFactory& TelemetryClientFactory::instance() {
    static TelemetryClientFactory factory(process_config());
    return factory;
}

TelemetryClientFactory::TelemetryClientFactory(const TelemetryConfig& config,
                                               AuthResolver auth_resolver,
                                               PushClientProvider push_client_provider,
                                               std::shared_ptr<WorkerPool> workers,
                                               ClientDecorator client_decorator)
    : pimpl_(std::make_unique<Impl>(config, std::move(auth_resolver),
                                    std::move(push_client_provider), std::move(workers),
                                    std::move(client_decorator))) {}

TelemetryClientFactory::~TelemetryClientFactory() = default;

std::shared_ptr<ITelemetryClient> TelemetryClientFactory::get_client(const ConnectionContext& context) {
    return pimpl_->get_client(context);
}

void TelemetryClientFactory::close_client(const ConnectionContext& context) {
    pimpl_->close_client(context);
}

void TelemetryClientFactory::reset() { pimpl_->reset(); }
void TelemetryClientFactory::flush_all() { pimpl_->flush_all(); }

size_t TelemetryClientFactory::authenticated_client_count() const {
    return pimpl_->authenticated_client_count();
}

size_t TelemetryClientFactory::unauthenticated_client_count() const {
    return pimpl_->unauthenticated_client_count();
}

const TelemetryConfig& TelemetryClientFactory::config() const { return pimpl_->config(); }
std::shared_ptr<WorkerPool> TelemetryClientFactory::workers() const { return pimpl_->workers(); }

std::shared_ptr<CircuitBreakerRegistry> TelemetryClientFactory::push_breakers() const {
    return pimpl_->push_breakers();
}

} // namespace sqltelemetry
