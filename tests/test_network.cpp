// tests/test_network.cpp
// Tests for the TCP push transport and its wire encoding

#include <gtest/gtest.h>
#include "sqltelemetry/network.hpp"
#include "generated/telemetry_generated.h"
#include <flatbuffers/flatbuffers.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <thread>
#include <vector>

using namespace sqltelemetry;

namespace {

PushTarget make_target(const std::string& host, bool with_token = true) {
    PushTarget target;
    target.host = host;
    target.connection_id = "conn-42";
    target.auth_mode = with_token ? AuthMode::AUTHENTICATED : AuthMode::UNAUTHENTICATED;
    if (with_token) {
        target.auth = AuthConfig{host, "secret-token"};
    }
    return target;
}

NetworkConfig fast_network() {
    NetworkConfig config;
    config.connect_timeout = std::chrono::milliseconds(500);
    config.send_timeout = std::chrono::milliseconds(500);
    config.max_retries = 2;
    config.retry_delay = std::chrono::milliseconds(10);
    config.max_retry_delay = std::chrono::milliseconds(20);
    return config;
}

// One-shot loopback collector that reads a single length-prefixed frame
class LoopbackCollector {
public:
    LoopbackCollector() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { receive(); });
    }

    ~LoopbackCollector() {
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    uint16_t port() const { return port_; }

    const std::vector<uint8_t>& wait_for_frame() {
        thread_.join();
        return frame_;
    }

private:
    void receive() {
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        uint8_t buffer[4096];
        ssize_t received;
        while ((received = ::recv(client, buffer, sizeof(buffer), 0)) > 0) {
            frame_.insert(frame_.end(), buffer, buffer + received);
        }
        ::close(client);
    }

    int listen_fd_;
    uint16_t port_ = 0;
    std::vector<uint8_t> frame_;
    std::thread thread_;
};

} // namespace

class NetworkTest : public ::testing::Test {
protected:
    TelemetryRequest make_request() {
        TelemetryRequest request;
        request.upload_time_millis = 1700000000123;
        request.proto_logs = {R"({"kind":"usage"})", R"({"kind":"latency"})"};
        return request;
    }
};

TEST_F(NetworkTest, ParsesHostForms) {
    using NetworkUtils::parse_host_url;

    EXPECT_EQ(parse_host_url("db.example.com", 50000),
              std::make_pair(std::string("db.example.com"), uint16_t(50000)));
    EXPECT_EQ(parse_host_url("db.example.com:7000", 50000),
              std::make_pair(std::string("db.example.com"), uint16_t(7000)));
    EXPECT_EQ(parse_host_url("https://db.example.com/sql/1.0", 50000),
              std::make_pair(std::string("db.example.com"), uint16_t(50000)));
    EXPECT_EQ(parse_host_url("  https://db.example.com:443/path  ", 50000),
              std::make_pair(std::string("db.example.com"), uint16_t(443)));
    EXPECT_EQ(parse_host_url("[::1]:9000", 50000),
              std::make_pair(std::string("::1"), uint16_t(9000)));
    EXPECT_EQ(parse_host_url("[::1]", 50000),
              std::make_pair(std::string("::1"), uint16_t(50000)));

    EXPECT_TRUE(parse_host_url("", 50000).first.empty());
    EXPECT_TRUE(parse_host_url("https:///path", 50000).first.empty());
    EXPECT_TRUE(parse_host_url("db.example.com:99999", 50000).first.empty());
    EXPECT_TRUE(parse_host_url("[::1", 50000).first.empty());
}

TEST_F(NetworkTest, ClientDerivesEndpointFromTarget) {
    TcpTelemetryPushClient client(make_target("https://db.example.com:8443/sql"), fast_network());
    EXPECT_EQ(client.host(), "db.example.com");
    EXPECT_EQ(client.port(), 8443);

    TcpTelemetryPushClient defaulted(make_target("db.example.com"), fast_network());
    EXPECT_EQ(defaulted.port(), TcpTelemetryPushClient::DEFAULT_PORT);
}

TEST_F(NetworkTest, RejectsUnusableHost) {
    EXPECT_THROW(TcpTelemetryPushClient(make_target(""), fast_network()), ValidationError);
    EXPECT_THROW(TcpTelemetryPushClient(make_target("db.example.com:0"), fast_network()),
                 ValidationError);
}

TEST_F(NetworkTest, EncodesRequestAsFlatBuffer) {
    auto payload = TcpTelemetryPushClient::encode(make_request(), make_target("db.example.com"));

    flatbuffers::Verifier verifier(payload.data(), payload.size());
    ASSERT_TRUE(wire::VerifyTelemetryRequestBuffer(verifier));

    auto decoded = wire::GetTelemetryRequest(payload.data());
    EXPECT_EQ(decoded->upload_time_millis(), 1700000000123);
    ASSERT_NE(decoded->proto_logs(), nullptr);
    ASSERT_EQ(decoded->proto_logs()->size(), 2u);
    EXPECT_EQ(decoded->proto_logs()->Get(0)->str(), R"({"kind":"usage"})");
    EXPECT_EQ(decoded->auth_token()->str(), "secret-token");
    EXPECT_EQ(decoded->connection_id()->str(), "conn-42");
}

TEST_F(NetworkTest, UnauthenticatedRequestCarriesNoToken) {
    auto payload = TcpTelemetryPushClient::encode(make_request(),
                                                  make_target("db.example.com", false));
    auto decoded = wire::GetTelemetryRequest(payload.data());
    EXPECT_EQ(decoded->auth_token(), nullptr);
}

TEST_F(NetworkTest, FramePrefixesBigEndianLength) {
    std::vector<uint8_t> payload(300, 0xAB);
    auto frame_data = TcpTelemetryPushClient::frame(payload);

    ASSERT_EQ(frame_data.size(), 304u);
    EXPECT_EQ(frame_data[0], 0x00);
    EXPECT_EQ(frame_data[1], 0x00);
    EXPECT_EQ(frame_data[2], 0x01);
    EXPECT_EQ(frame_data[3], 0x2C);
    EXPECT_EQ(frame_data[4], 0xAB);
}

TEST_F(NetworkTest, DeliversFrameToCollector) {
    LoopbackCollector collector;
    TcpTelemetryPushClient client(make_target("127.0.0.1:" + std::to_string(collector.port())),
                                  fast_network());

    client.push_event(make_request());

    const auto& received = collector.wait_for_frame();
    ASSERT_GE(received.size(), 4u);
    uint32_t length = (uint32_t(received[0]) << 24) | (uint32_t(received[1]) << 16) |
                      (uint32_t(received[2]) << 8) | uint32_t(received[3]);
    ASSERT_EQ(length, received.size() - 4);

    auto decoded = wire::GetTelemetryRequest(received.data() + 4);
    EXPECT_EQ(decoded->proto_logs()->size(), 2u);
    EXPECT_EQ(decoded->connection_id()->str(), "conn-42");
}

TEST_F(NetworkTest, RefusedConnectionIsRetriedThenReported) {
    TcpTelemetryPushClient client(make_target("127.0.0.1:1"), fast_network());

    try {
        client.push_event(make_request());
        FAIL() << "expected the push to fail";
    } catch (const NetworkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONNECTION_REFUSED);
        EXPECT_EQ(e.retries(), 2);
        EXPECT_EQ(e.operation(), "connect");
    }
}

TEST_F(NetworkTest, NoRetriesReportsFirstFailure) {
    NetworkConfig config = fast_network();
    config.max_retries = 0;
    TcpTelemetryPushClient client(make_target("127.0.0.1:1"), config);

    try {
        client.push_event(make_request());
        FAIL() << "expected the push to fail";
    } catch (const NetworkError& e) {
        EXPECT_EQ(e.retries(), 0);
    }
}

TEST_F(NetworkTest, MapsErrnoToErrorCodes) {
    EXPECT_EQ(NetworkUtils::create_network_error("connect", ECONNREFUSED).code(),
              ErrorCode::CONNECTION_REFUSED);
    EXPECT_EQ(NetworkUtils::create_network_error("connect", EHOSTUNREACH).code(),
              ErrorCode::NETWORK_UNREACHABLE);
    EXPECT_EQ(NetworkUtils::create_network_error("connect", ETIMEDOUT).code(),
              ErrorCode::CONNECTION_TIMEOUT);
    EXPECT_EQ(NetworkUtils::create_network_error("send", EPIPE).code(),
              ErrorCode::SEND_FAILED);
    EXPECT_EQ(NetworkUtils::create_network_error("connect", EACCES).code(),
              ErrorCode::CONNECTION_FAILED);
}
