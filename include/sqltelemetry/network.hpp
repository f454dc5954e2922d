// include/sqltelemetry/network.hpp
// Purpose: Default push transport
// FlatBuffers-encoded TelemetryRequest, length-prefixed frames over TCP

#pragma once

#include "config.hpp"
#include "push.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sqltelemetry {

class TcpTelemetryPushClient : public ITelemetryPushClient {
public:
    static constexpr uint16_t DEFAULT_PORT = 50000;

    // target.host may be "host", "host:port" or a URL; throws ValidationError
    // when no usable host can be extracted
    TcpTelemetryPushClient(const PushTarget& target, const NetworkConfig& config);

    // Connects, sends one frame and disconnects. Connection failures are retried with
    // exponential backoff up to max_retries. Throws NetworkError or TimeoutError.
    void push_event(const TelemetryRequest& request) override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    static std::vector<uint8_t> encode(const TelemetryRequest& request, const PushTarget& target);
    static std::vector<uint8_t> frame(const std::vector<uint8_t>& payload);

private:
    void send_frame(const std::vector<uint8_t>& frame_data) const;

    PushTarget target_;
    NetworkConfig config_;
    std::string host_;
    uint16_t port_;
};

namespace NetworkUtils {

// Splits "scheme://host:port/path" into host and port (default_port when absent)
std::pair<std::string, uint16_t> parse_host_url(const std::string& host_url, uint16_t default_port);

NetworkError create_network_error(const std::string& operation, int error_code);
TimeoutError create_timeout_error(const std::string& operation, std::chrono::milliseconds timeout);

} // namespace NetworkUtils

} // namespace sqltelemetry
