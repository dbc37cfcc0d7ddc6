#include "activities/config.hpp"
#include "activities/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace activities {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // anonymous namespace

uint16_t parse_port(const std::string& value, const std::string& name) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError(name + " must be a port number, got '" + value + "'");
    }
    if (value.size() > 5) {
        throw ConfigError(name + " out of range: " + value);
    }
    int port = std::stoi(value);
    if (port < 1 || port > 65535) {
        throw ConfigError(name + " out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

bool parse_bool(const std::string& value, const std::string& name) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    throw ConfigError(name + " must be a boolean, got '" + value + "'");
}

ServerConfig load_config(int argc, char** argv) {
    ServerConfig config;

    if (const char* host = env_or_null("ACTIVITIES_HOST")) {
        config.host = host;
    }
    if (const char* port = env_or_null("PORT")) {
        config.http_port = parse_port(port, "PORT");
    }
    if (const char* port = env_or_null("GRPC_PORT")) {
        config.grpc_port = parse_port(port, "GRPC_PORT");
    }
    if (const char* path = env_or_null("ACTIVITIES_CATALOG")) {
        config.catalog_path = path;
    }
    if (const char* enforce = env_or_null("ACTIVITIES_ENFORCE_CAPACITY")) {
        config.enforce_capacity = parse_bool(enforce, "ACTIVITIES_ENFORCE_CAPACITY");
    }

    if (argc > 1) {
        config.http_port = parse_port(argv[1], "port argument");
    }

    if (config.http_port == config.grpc_port) {
        throw ConfigError("HTTP and gRPC ports must differ: " + std::to_string(config.http_port));
    }
    return config;
}

} // namespace activities
