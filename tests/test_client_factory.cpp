// tests/test_client_factory.cpp
// Tests for the telemetry client registry

#include <gtest/gtest.h>
#include "sqltelemetry/client_factory.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace sqltelemetry;

namespace {

struct PushLog {
    std::mutex mutex;
    std::vector<PushTarget> targets;
    size_t events = 0;
};

class RecordingPushClient : public ITelemetryPushClient {
public:
    RecordingPushClient(std::shared_ptr<PushLog> log, PushTarget target)
        : log_(std::move(log)), target_(std::move(target)) {}

    void push_event(const TelemetryRequest& request) override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->targets.push_back(target_);
        log_->events += request.proto_logs.size();
    }

private:
    std::shared_ptr<PushLog> log_;
    PushTarget target_;
};

// Not derived from std::exception
struct TeardownFailure {};

// Closes its delegate, then fails the close when asked to
class CloseFailingClient : public ITelemetryClient {
public:
    enum class Failure { NONE, STD, NON_STD };

    CloseFailingClient(std::shared_ptr<ITelemetryClient> delegate, Failure failure,
                       std::shared_ptr<std::atomic<int>> closes)
        : delegate_(std::move(delegate)), failure_(failure), closes_(std::move(closes)) {}

    void export_event(const TelemetryEvent& event) override { delegate_->export_event(event); }
    void flush() override { delegate_->flush(); }

    void close() override {
        delegate_->close();
        (*closes_)++;
        switch (failure_) {
            case Failure::NONE: break;
            case Failure::STD: throw Errors::send_failed("collector went away");
            case Failure::NON_STD: throw TeardownFailure{};
        }
    }

private:
    std::shared_ptr<ITelemetryClient> delegate_;
    Failure failure_;
    std::shared_ptr<std::atomic<int>> closes_;
};

PropertiesConnectionContext make_context(const std::string& id,
                                         PropertiesConnectionContext::PropertyMap properties = {}) {
    return PropertiesConnectionContext(id, "https://db.example.com/sql", std::move(properties));
}

} // namespace

class ClientFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.thread_pool_size = 2;
        config_.flush_interval = std::chrono::milliseconds(0);

        log_ = std::make_shared<PushLog>();
        workers_ = std::make_shared<WorkerPool>(2, 100);
    }

    void TearDown() override {
        workers_->shutdown();
    }

    std::unique_ptr<TelemetryClientFactory> make_factory(AuthResolver resolver = nullptr,
                                                         ClientDecorator decorator = nullptr) {
        auto log = log_;
        PushClientProvider provider = [log](const PushTarget& target) {
            return std::unique_ptr<ITelemetryPushClient>(
                std::make_unique<RecordingPushClient>(log, target));
        };
        return std::make_unique<TelemetryClientFactory>(config_, std::move(resolver),
                                                        provider, workers_,
                                                        std::move(decorator));
    }

    static AuthResolver token_resolver(const std::string& host = "") {
        return [host](const ConnectionContext&) -> std::optional<AuthConfig> {
            return AuthConfig{host, "secret-token"};
        };
    }

    TelemetryConfig config_;
    std::shared_ptr<PushLog> log_;
    std::shared_ptr<WorkerPool> workers_;
};

TEST_F(ClientFactoryTest, ReturnsSameClientForSameConnection) {
    auto factory = make_factory();
    auto context = make_context("conn-1");

    auto first = factory->get_client(context);
    auto second = factory->get_client(context);

    EXPECT_EQ(first, second);
    EXPECT_EQ(factory->unauthenticated_client_count(), 1u);
    EXPECT_EQ(factory->authenticated_client_count(), 0u);
}

TEST_F(ClientFactoryTest, DistinctConnectionsGetDistinctClients) {
    auto factory = make_factory();

    auto first = factory->get_client(make_context("conn-1"));
    auto second = factory->get_client(make_context("conn-2"));

    EXPECT_NE(first, second);
    EXPECT_EQ(factory->unauthenticated_client_count(), 2u);
}

TEST_F(ClientFactoryTest, ConcurrentLookupsShareOneClient) {
    auto factory = make_factory();
    auto context = make_context("conn-1");

    std::vector<std::shared_ptr<ITelemetryClient>> results(16);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&factory, &context, &results, i]() {
            results[i] = factory->get_client(context);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& client : results) {
        EXPECT_EQ(client, results.front());
    }
    EXPECT_EQ(factory->unauthenticated_client_count(), 1u);
}

TEST_F(ClientFactoryTest, CloseClientRemovesAndNextLookupCreatesNew) {
    auto factory = make_factory();
    auto context = make_context("conn-1");

    auto first = factory->get_client(context);
    factory->close_client(context);
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);

    auto second = factory->get_client(context);
    EXPECT_NE(first, second);
}

TEST_F(ClientFactoryTest, CloseClientIsIdempotent) {
    auto factory = make_factory();
    auto context = make_context("conn-1");
    factory->get_client(context);

    EXPECT_NO_THROW(factory->close_client(context));
    EXPECT_NO_THROW(factory->close_client(context));
    EXPECT_NO_THROW(factory->close_client(make_context("never-opened")));
}

TEST_F(ClientFactoryTest, ResolvedCredentialsGiveAuthenticatedClient) {
    auto factory = make_factory(token_resolver("warehouse.example.com"));
    auto context = make_context("conn-1", {{PropertyKeys::TELEMETRY_BATCH_SIZE, "1"}});

    auto client = factory->get_client(context);
    EXPECT_EQ(factory->authenticated_client_count(), 1u);
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);

    client->export_event(TelemetryEvent(EventKinds::USAGE, {{"statements", int64_t(1)}}));
    workers_->shutdown();

    std::lock_guard<std::mutex> lock(log_->mutex);
    ASSERT_EQ(log_->targets.size(), 1u);
    EXPECT_EQ(log_->targets[0].host, "warehouse.example.com");
    EXPECT_EQ(log_->targets[0].auth_mode, AuthMode::AUTHENTICATED);
    ASSERT_TRUE(log_->targets[0].auth.has_value());
    EXPECT_EQ(log_->targets[0].auth->token, "secret-token");
}

TEST_F(ClientFactoryTest, EmptyAuthHostFallsBackToConnectionHost) {
    auto factory = make_factory(token_resolver());
    auto context = make_context("conn-1", {{PropertyKeys::TELEMETRY_BATCH_SIZE, "1"}});

    factory->get_client(context)->export_event(TelemetryEvent(EventKinds::USAGE, {}));
    workers_->shutdown();

    std::lock_guard<std::mutex> lock(log_->mutex);
    ASSERT_EQ(log_->targets.size(), 1u);
    EXPECT_EQ(log_->targets[0].host, "https://db.example.com/sql");
}

TEST_F(ClientFactoryTest, FailingResolverGivesUnauthenticatedClient) {
    AuthResolver failing = [](const ConnectionContext&) -> std::optional<AuthConfig> {
        throw std::runtime_error("token endpoint unreachable");
    };
    auto factory = make_factory(failing);

    EXPECT_NO_THROW(factory->get_client(make_context("conn-1")));
    EXPECT_EQ(factory->authenticated_client_count(), 0u);
    EXPECT_EQ(factory->unauthenticated_client_count(), 1u);
}

TEST_F(ClientFactoryTest, AuthModesAreTrackedSeparately) {
    bool authenticated = true;
    AuthResolver toggling = [&authenticated](const ConnectionContext&) -> std::optional<AuthConfig> {
        if (!authenticated) return std::nullopt;
        return AuthConfig{"", "token"};
    };
    auto factory = make_factory(toggling);
    auto context = make_context("conn-1");

    auto with_auth = factory->get_client(context);
    authenticated = false;
    auto without_auth = factory->get_client(context);

    EXPECT_NE(with_auth, without_auth);
    EXPECT_EQ(factory->authenticated_client_count(), 1u);
    EXPECT_EQ(factory->unauthenticated_client_count(), 1u);

    // close_client removes both entries for the connection
    factory->close_client(context);
    EXPECT_EQ(factory->authenticated_client_count(), 0u);
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);
}

TEST_F(ClientFactoryTest, DisabledTelemetryReturnsNoopClient) {
    auto factory = make_factory();
    auto context = make_context("conn-1", {{PropertyKeys::TELEMETRY_ENABLED, "false"}});

    auto client = factory->get_client(context);

    EXPECT_EQ(client, std::static_pointer_cast<ITelemetryClient>(NoopTelemetryClient::instance()));
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);
    EXPECT_EQ(factory->authenticated_client_count(), 0u);
}

TEST_F(ClientFactoryTest, BreakerEnabledWrapsClient) {
    auto factory = make_factory();
    auto client = factory->get_client(make_context("conn-1"));

    auto decorated = std::dynamic_pointer_cast<CircuitBreakerTelemetryClient>(client);
    ASSERT_NE(decorated, nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<TelemetryClient>(decorated->delegate()), nullptr);
}

TEST_F(ClientFactoryTest, BreakerDisabledReturnsPlainClient) {
    auto factory = make_factory();
    auto context = make_context("conn-1", {{PropertyKeys::CIRCUIT_BREAKER_ENABLED, "false"}});

    auto client = factory->get_client(context);

    EXPECT_EQ(std::dynamic_pointer_cast<CircuitBreakerTelemetryClient>(client), nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<TelemetryClient>(client), nullptr);
}

TEST_F(ClientFactoryTest, ConnectionBatchSizeIsApplied) {
    auto factory = make_factory();
    auto context = make_context("conn-1", {{PropertyKeys::CIRCUIT_BREAKER_ENABLED, "false"},
                                           {PropertyKeys::TELEMETRY_BATCH_SIZE, "25"}});

    auto client = std::dynamic_pointer_cast<TelemetryClient>(factory->get_client(context));
    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client->batch_size(), 25u);
}

TEST_F(ClientFactoryTest, ResetClosesEverything) {
    auto factory = make_factory(token_resolver());
    auto context = make_context("conn-1", {{PropertyKeys::CIRCUIT_BREAKER_ENABLED, "false"}});

    auto client = std::dynamic_pointer_cast<TelemetryClient>(factory->get_client(context));
    ASSERT_NE(client, nullptr);
    factory->get_client(make_context("conn-2"));

    factory->reset();

    EXPECT_TRUE(client->is_closed());
    EXPECT_EQ(factory->authenticated_client_count(), 0u);
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);
}

TEST_F(ClientFactoryTest, FlushAllShipsQueuedEvents) {
    auto factory = make_factory();
    auto first = factory->get_client(make_context("conn-1"));
    auto second = factory->get_client(make_context("conn-2"));

    first->export_event(TelemetryEvent(EventKinds::LATENCY, {{"duration_ms", int64_t(4)}}));
    second->export_event(TelemetryEvent(EventKinds::LATENCY, {{"duration_ms", int64_t(9)}}));
    second->export_event(TelemetryEvent(EventKinds::LATENCY, {{"duration_ms", int64_t(2)}}));

    factory->flush_all();
    workers_->shutdown();

    std::lock_guard<std::mutex> lock(log_->mutex);
    EXPECT_EQ(log_->targets.size(), 2u);
    EXPECT_EQ(log_->events, 3u);
}

TEST_F(ClientFactoryTest, FlushTimerShipsQueuedEvents) {
    config_.flush_interval = std::chrono::milliseconds(100);
    auto factory = make_factory();
    factory->get_client(make_context("conn-1"))
        ->export_event(TelemetryEvent(EventKinds::USAGE, {{"statements", int64_t(3)}}));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            if (log_->events == 1) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::lock_guard<std::mutex> lock(log_->mutex);
    EXPECT_EQ(log_->events, 1u);
}

TEST_F(ClientFactoryTest, InvalidConfigIsRejected) {
    config_.thread_pool_size = 0;
    EXPECT_THROW(make_factory(), ConfigError);
}

TEST_F(ClientFactoryTest, DefaultCollaboratorsAreCreated) {
    TelemetryClientFactory factory(config_);

    ASSERT_NE(factory.workers(), nullptr);
    EXPECT_EQ(factory.workers()->thread_count(), 2u);
    ASSERT_NE(factory.push_breakers(), nullptr);
    EXPECT_EQ(factory.config().thread_pool_size, 2u);

    // No resolver means no credentials
    factory.get_client(make_context("conn-1"));
    EXPECT_EQ(factory.unauthenticated_client_count(), 1u);
    factory.reset();
    factory.workers()->shutdown();
}

TEST_F(ClientFactoryTest, DecoratorWrapsBuiltClients) {
    auto closes = std::make_shared<std::atomic<int>>(0);
    std::vector<std::string> hosts;
    ClientDecorator decorator = [closes, &hosts](std::shared_ptr<ITelemetryClient> client,
                                                 const PushTarget& target) {
        hosts.push_back(target.host);
        return std::make_shared<CloseFailingClient>(std::move(client),
                                                    CloseFailingClient::Failure::NONE, closes);
    };
    auto factory = make_factory(nullptr, decorator);

    auto client = factory->get_client(make_context("conn-1"));
    EXPECT_NE(std::dynamic_pointer_cast<CloseFailingClient>(client), nullptr);
    EXPECT_EQ(factory->get_client(make_context("conn-1")), client);
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0], "https://db.example.com/sql");
}

TEST_F(ClientFactoryTest, NullDecoratorResultKeepsBuiltClient) {
    ClientDecorator decorator = [](std::shared_ptr<ITelemetryClient>, const PushTarget&) {
        return std::shared_ptr<ITelemetryClient>();
    };
    auto factory = make_factory(nullptr, decorator);

    auto client = factory->get_client(make_context("conn-1"));
    EXPECT_NE(std::dynamic_pointer_cast<CircuitBreakerTelemetryClient>(client), nullptr);
}

TEST_F(ClientFactoryTest, FailingCloseDoesNotBlockSiblingEntry) {
    auto closes = std::make_shared<std::atomic<int>>(0);
    ClientDecorator decorator = [closes](std::shared_ptr<ITelemetryClient> client,
                                         const PushTarget& target) {
        auto failure = target.auth_mode == AuthMode::AUTHENTICATED
            ? CloseFailingClient::Failure::STD
            : CloseFailingClient::Failure::NONE;
        return std::make_shared<CloseFailingClient>(std::move(client), failure, closes);
    };

    bool authenticated = true;
    AuthResolver toggling = [&authenticated](const ConnectionContext&) -> std::optional<AuthConfig> {
        if (!authenticated) return std::nullopt;
        return AuthConfig{"", "token"};
    };
    auto factory = make_factory(toggling, decorator);
    auto context = make_context("conn-1");

    factory->get_client(context);
    authenticated = false;
    factory->get_client(context);
    ASSERT_EQ(factory->authenticated_client_count(), 1u);
    ASSERT_EQ(factory->unauthenticated_client_count(), 1u);

    EXPECT_NO_THROW(factory->close_client(context));
    EXPECT_EQ(closes->load(), 2);
    EXPECT_EQ(factory->authenticated_client_count(), 0u);
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);
}

TEST_F(ClientFactoryTest, ResetSurvivesFailingCloses) {
    auto closes = std::make_shared<std::atomic<int>>(0);
    ClientDecorator decorator = [closes](std::shared_ptr<ITelemetryClient> client,
                                         const PushTarget& target) {
        auto failure = target.connection_id == "conn-1" ? CloseFailingClient::Failure::NON_STD
                     : target.connection_id == "conn-2" ? CloseFailingClient::Failure::STD
                     : CloseFailingClient::Failure::NONE;
        return std::make_shared<CloseFailingClient>(std::move(client), failure, closes);
    };
    auto factory = make_factory(nullptr, decorator);

    factory->get_client(make_context("conn-1"));
    factory->get_client(make_context("conn-2"));
    factory->get_client(make_context("conn-3"));

    EXPECT_NO_THROW(factory->reset());
    EXPECT_EQ(closes->load(), 3);
    EXPECT_EQ(factory->unauthenticated_client_count(), 0u);
}
