#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace mergington {

/**
 * Base exception for all registry errors.
 *
 * The message is the human-readable detail returned to callers.
 */
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the named activity does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the request conflicts with the current roster.
     */
    virtual bool is_conflict() const { return false; }

    /**
     * Returns true if the request itself is malformed.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * HTTP status code reported for this error.
     */
    virtual int http_status() const { return 500; }

    /**
     * gRPC status reported for this error.
     */
    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::UNKNOWN, what());
    }
};

/**
 * Thrown when an activity name is not a key in the registry.
 * Maps to HTTP 404 and gRPC NOT_FOUND.
 */
class NotFoundError : public RegistryError {
public:
    explicit NotFoundError(const std::string& message)
        : RegistryError(message) {}

    bool is_not_found() const override { return true; }
    int http_status() const override { return 404; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
    }
};

/**
 * Thrown when a signup or unregister is rejected by the roster rules.
 * Maps to HTTP 400 and gRPC FAILED_PRECONDITION.
 */
class ConflictError : public RegistryError {
public:
    explicit ConflictError(const std::string& message)
        : RegistryError(message) {}

    bool is_conflict() const override { return true; }
    int http_status() const override { return 400; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what());
    }
};

/**
 * Thrown for malformed requests, bad seed data and bad configuration.
 * Maps to HTTP 422 and gRPC INVALID_ARGUMENT.
 */
class InvalidArgumentError : public RegistryError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : RegistryError(message) {}

    bool is_invalid_argument() const override { return true; }
    int http_status() const override { return 422; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

} // namespace mergington
