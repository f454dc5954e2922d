// include/sqltelemetry/sqltelemetry.hpp
// Purpose: Main header file for the sqltelemetry library
// Driver code includes this to obtain telemetry clients per connection

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "circuit_breaker.hpp"
#include "worker_pool.hpp"
#include "push.hpp"
#include "telemetry_client.hpp"
#include "client_factory.hpp"
#include "network.hpp"

namespace sqltelemetry {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string version() {
    return VERSION;
}

} // namespace sqltelemetry
