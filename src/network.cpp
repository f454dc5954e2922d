// src/network.cpp
// Implementation of the TCP push transport

#include "sqltelemetry/network.hpp"
#include "sqltelemetry/logging.hpp"
#include "sqltelemetry/utils.hpp"
#include "generated/telemetry_generated.h"
#include <flatbuffers/flatbuffers.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <cstring>
#include <thread>

namespace sqltelemetry {

namespace {

// Owns a socket descriptor for the duration of one push
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

// Owns a getaddrinfo result list
class AddressList {
public:
    AddressList(const std::string& host, uint16_t port) : result_(nullptr) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        std::string port_str = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result_);
        if (rc != 0) {
            result_ = nullptr;
            throw Errors::dns_resolution_failed(host + " (" + gai_strerror(rc) + ")");
        }
    }

    ~AddressList() {
        if (result_) {
            freeaddrinfo(result_);
        }
    }

    AddressList(const AddressList&) = delete;
    AddressList& operator=(const AddressList&) = delete;

    const struct addrinfo* get() const { return result_; }

private:
    struct addrinfo* result_;
};

void set_non_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void set_nodelay(int fd) {
    int flag = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}

// Message of a NetworkError without its "Network error during '...': " prefix
std::string strip_prefix(const NetworkError& e) {
    std::string message = e.what();
    size_t pos = message.find("': ");
    return pos == std::string::npos ? message : message.substr(pos + 3);
}

bool is_retryable(const Error& e) {
    switch (e.code()) {
        case ErrorCode::CONNECTION_FAILED:
        case ErrorCode::CONNECTION_REFUSED:
        case ErrorCode::CONNECTION_TIMEOUT:
        case ErrorCode::NETWORK_UNREACHABLE:
        case ErrorCode::TIMEOUT:
            return true;
        default:
            return false;
    }
}

// Connects to the first address that accepts within the timeout
int connect_to(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    AddressList addresses(host, port);
    int last_error = ECONNREFUSED;
    bool timed_out = false;

    for (const struct addrinfo* addr = addresses.get(); addr != nullptr; addr = addr->ai_next) {
        int fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }
        SocketHandle socket(fd);
        set_non_blocking(fd);
        set_nodelay(fd);

        if (::connect(fd, addr->ai_addr, addr->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last_error = errno;
                continue;
            }

            // Non-blocking connect in progress
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int poll_result = poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (poll_result == 0) {
                timed_out = true;
                continue;
            }
            if (poll_result < 0) {
                last_error = errno;
                continue;
            }

            int socket_error = 0;
            socklen_t len = sizeof(socket_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &len) < 0) {
                last_error = errno;
                continue;
            }
            if (socket_error != 0) {
                last_error = socket_error;
                continue;
            }
        }

        return socket.release();
    }

    if (timed_out) {
        throw NetworkUtils::create_timeout_error("connect", timeout);
    }
    throw NetworkUtils::create_network_error("connect", last_error);
}

} // namespace

//=============================================================================
// TcpTelemetryPushClient Implementation
//=============================================================================

TcpTelemetryPushClient::TcpTelemetryPushClient(const PushTarget& target, const NetworkConfig& config)
    : target_(target), config_(config), port_(DEFAULT_PORT) {
    auto endpoint = NetworkUtils::parse_host_url(target.host, DEFAULT_PORT);
    if (endpoint.first.empty() || !Utils::is_valid_port(endpoint.second)) {
        throw Errors::invalid_argument("host", "cannot derive a telemetry endpoint from '" +
                                       target.host + "'");
    }
    host_ = endpoint.first;
    port_ = endpoint.second;
}

std::vector<uint8_t> TcpTelemetryPushClient::encode(const TelemetryRequest& request,
                                                    const PushTarget& target) {
    flatbuffers::FlatBufferBuilder builder(1024);

    std::vector<flatbuffers::Offset<flatbuffers::String>> logs;
    logs.reserve(request.proto_logs.size());
    for (const auto& log : request.proto_logs) {
        logs.push_back(builder.CreateString(log));
    }
    auto logs_offset = builder.CreateVector(logs);

    flatbuffers::Offset<flatbuffers::String> token_offset;
    if (target.auth && !target.auth->token.empty()) {
        token_offset = builder.CreateString(target.auth->token);
    }
    auto connection_offset = builder.CreateString(target.connection_id);

    auto root = wire::CreateTelemetryRequest(builder, request.upload_time_millis, logs_offset,
                                             token_offset, connection_offset);
    builder.Finish(root);

    const uint8_t* buf = builder.GetBufferPointer();
    return std::vector<uint8_t>(buf, buf + builder.GetSize());
}

std::vector<uint8_t> TcpTelemetryPushClient::frame(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> frame_data;
    frame_data.reserve(4 + payload.size());

    // 4-byte big-endian length prefix
    uint32_t data_length = static_cast<uint32_t>(payload.size());
    frame_data.push_back((data_length >> 24) & 0xFF);
    frame_data.push_back((data_length >> 16) & 0xFF);
    frame_data.push_back((data_length >> 8) & 0xFF);
    frame_data.push_back(data_length & 0xFF);

    frame_data.insert(frame_data.end(), payload.begin(), payload.end());
    return frame_data;
}

void TcpTelemetryPushClient::push_event(const TelemetryRequest& request) {
    const std::vector<uint8_t> frame_data = frame(encode(request, target_));

    Utils::ExponentialBackoff backoff(config_.retry_delay, config_.backoff_multiplier,
                                      config_.max_retry_delay);
    int attempt = 0;

    while (true) {
        try {
            send_frame(frame_data);
            Log::trace("TcpTelemetryPushClient", "Pushed " +
                       std::to_string(request.proto_logs.size()) + " telemetry logs to " +
                       host_ + ":" + std::to_string(port_));
            return;
        } catch (const NetworkError& e) {
            if (!is_retryable(e) || attempt >= config_.max_retries) {
                if (attempt > 0) {
                    throw NetworkError(e.code(), e.operation(), strip_prefix(e), attempt);
                }
                throw;
            }
        } catch (const TimeoutError&) {
            if (attempt >= config_.max_retries) {
                throw;
            }
        }

        attempt++;
        std::this_thread::sleep_for(backoff.next_delay());
    }
}

void TcpTelemetryPushClient::send_frame(const std::vector<uint8_t>& frame_data) const {
    SocketHandle socket(connect_to(host_, port_, config_.connect_timeout));

    size_t total_sent = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total_sent < frame_data.size()) {
        ssize_t sent = ::send(socket.get(), frame_data.data() + total_sent,
                              frame_data.size() - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Would block, wait for socket to be ready
                struct pollfd pfd{};
                pfd.fd = socket.get();
                pfd.events = POLLOUT;

                int poll_result = poll(&pfd, 1, static_cast<int>(config_.send_timeout.count()));
                if (poll_result <= 0) {
                    throw NetworkUtils::create_timeout_error("send", config_.send_timeout);
                }
                continue;
            }
            throw NetworkUtils::create_network_error("send", errno);
        } else if (sent == 0) {
            throw Errors::send_failed("Connection closed by peer");
        }

        total_sent += static_cast<size_t>(sent);

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (elapsed > config_.send_timeout) {
            throw NetworkUtils::create_timeout_error("send", config_.send_timeout);
        }
    }
}

//=============================================================================
// NetworkUtils Implementation
//=============================================================================

namespace NetworkUtils {

std::pair<std::string, uint16_t> parse_host_url(const std::string& host_url, uint16_t default_port) {
    std::string rest = Utils::trim(host_url);

    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        rest = rest.substr(scheme_end + 3);
    }

    size_t path_start = rest.find('/');
    if (path_start != std::string::npos) {
        rest = rest.substr(0, path_start);
    }

    if (rest.empty()) {
        return {"", 0};
    }

    // Bracketed IPv6 literal
    if (rest.front() == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return {"", 0};
        }
        std::string host = rest.substr(1, close - 1);
        if (close + 1 < rest.size() && rest[close + 1] == ':') {
            auto parsed = Utils::parse_endpoint("h" + rest.substr(close + 1));
            return parsed.first.empty() ? std::make_pair(std::string(), uint16_t(0))
                                        : std::make_pair(host, parsed.second);
        }
        return {host, default_port};
    }

    if (rest.find(':') == std::string::npos) {
        return {rest, default_port};
    }

    return Utils::parse_endpoint(rest);
}

NetworkError create_network_error(const std::string& operation, int error_code) {
    std::string message = std::strerror(error_code);
    switch (error_code) {
        case ECONNREFUSED:
            return NetworkError(ErrorCode::CONNECTION_REFUSED, operation, message);
        case ENETUNREACH:
        case EHOSTUNREACH:
            return NetworkError(ErrorCode::NETWORK_UNREACHABLE, operation, message);
        case ETIMEDOUT:
            return NetworkError(ErrorCode::CONNECTION_TIMEOUT, operation, message);
        case EPIPE:
        case ECONNRESET:
            return NetworkError(ErrorCode::SEND_FAILED, operation, message);
        default:
            return NetworkError(ErrorCode::CONNECTION_FAILED, operation, message);
    }
}

TimeoutError create_timeout_error(const std::string& operation, std::chrono::milliseconds timeout) {
    return TimeoutError(operation, timeout);
}

} // namespace NetworkUtils

} // namespace sqltelemetry
