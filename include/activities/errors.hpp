#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace activities {

/**
 * Thrown when the registry rejects a signup or unregister request.
 *
 * Carries the gRPC status the rejection maps to; the HTTP surface derives its
 * status code from the same value.
 */
class CommandRejectedError : public std::runtime_error {
public:
    grpc::StatusCode status_code;

    CommandRejectedError(const std::string& message, grpc::StatusCode code = grpc::StatusCode::UNKNOWN)
        : std::runtime_error(message), status_code(code) {}

    /// The named activity is not in the catalog.
    static CommandRejectedError not_found(const std::string& message) {
        return CommandRejectedError(message, grpc::StatusCode::NOT_FOUND);
    }

    /// The request conflicts with the current roster.
    static CommandRejectedError conflict(const std::string& message) {
        return CommandRejectedError(message, grpc::StatusCode::FAILED_PRECONDITION);
    }

    static CommandRejectedError invalid_argument(const std::string& message) {
        return CommandRejectedError(message, grpc::StatusCode::INVALID_ARGUMENT);
    }

    bool is_not_found() const { return status_code == grpc::StatusCode::NOT_FOUND; }
    bool is_conflict() const { return status_code == grpc::StatusCode::FAILED_PRECONDITION; }
    bool is_invalid_argument() const { return status_code == grpc::StatusCode::INVALID_ARGUMENT; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code, what());
    }
};

/**
 * Thrown when a catalog file cannot be read or describes an invalid catalog.
 */
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Thrown when a configuration value is malformed.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace activities
