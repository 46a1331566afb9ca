#include "mergington/config.hpp"
#include "mergington/errors.hpp"
#include "mergington/validation.hpp"
#include <cstdlib>

namespace mergington {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value && *value ? value : fallback;
}

} // anonymous namespace

uint16_t parse_port(const std::string& value, const std::string& field_name) {
    validation::require_not_empty(value, field_name);

    size_t consumed = 0;
    long port = 0;
    try {
        port = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgumentError(field_name + " must be a number: " + value);
    }
    if (consumed != value.size()) {
        throw InvalidArgumentError(field_name + " must be a number: " + value);
    }
    validation::require_in_range(port, 1L, 65535L, field_name);
    return static_cast<uint16_t>(port);
}

ServerConfig load_config(int argc, char** argv) {
    ServerConfig config;
    config.http_address = env_or("HOST", config.http_address);
    config.static_dir = env_or("STATIC_DIR", config.static_dir);
    config.activities_file = env_or("ACTIVITIES_FILE", config.activities_file);

    if (const char* port = std::getenv("PORT")) {
        config.http_port = parse_port(port, "PORT");
    }
    if (const char* port = std::getenv("GRPC_PORT")) {
        config.grpc_port = parse_port(port, "GRPC_PORT");
    }

    if (argc > 2) {
        throw InvalidArgumentError("Usage: " + std::string(argv[0]) + " [http_port]");
    }
    if (argc == 2) {
        config.http_port = parse_port(argv[1], "http_port");
    }

    return config;
}

} // namespace mergington
