#pragma once

#include <cstdint>
#include <string>

namespace activities {

constexpr uint16_t DEFAULT_HTTP_PORT = 8000;
constexpr uint16_t DEFAULT_GRPC_PORT = 50051;

/// Startup settings, read once from the environment.
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t http_port = DEFAULT_HTTP_PORT;
    uint16_t grpc_port = DEFAULT_GRPC_PORT;
    std::string catalog_path;  // empty: use the built-in catalog
    bool enforce_capacity = true;

    std::string http_address() const { return host + ":" + std::to_string(http_port); }
    std::string grpc_address() const { return host + ":" + std::to_string(grpc_port); }
};

/**
 * Read ACTIVITIES_HOST, PORT, GRPC_PORT, ACTIVITIES_CATALOG and
 * ACTIVITIES_ENFORCE_CAPACITY. A first positional argument overrides the
 * HTTP port.
 * @throws ConfigError on a malformed value.
 */
ServerConfig load_config(int argc, char** argv);

/// @throws ConfigError unless `value` is an integer in 1..65535.
uint16_t parse_port(const std::string& value, const std::string& name);

/// Accepts true/false, 1/0, yes/no and on/off, case-insensitively.
/// @throws ConfigError otherwise.
bool parse_bool(const std::string& value, const std::string& name);

} // namespace activities
