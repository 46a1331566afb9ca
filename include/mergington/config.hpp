#pragma once

#include <cstdint>
#include <string>

namespace mergington {

constexpr uint16_t DEFAULT_HTTP_PORT = 8000;
constexpr uint16_t DEFAULT_GRPC_PORT = 50051;

/// Runtime settings for the server process.
struct ServerConfig {
    std::string http_address = "0.0.0.0";
    uint16_t http_port = DEFAULT_HTTP_PORT;
    uint16_t grpc_port = DEFAULT_GRPC_PORT;
    std::string static_dir = "static";
    /// Empty means the built-in activity set.
    std::string activities_file;

    std::string grpc_address() const { return "0.0.0.0:" + std::to_string(grpc_port); }
};

/**
 * Build the configuration from HOST, PORT, GRPC_PORT, STATIC_DIR and
 * ACTIVITIES_FILE. A positional argument overrides the HTTP port.
 *
 * @throws InvalidArgumentError on a malformed port or extra arguments
 */
ServerConfig load_config(int argc, char** argv);

/// Parse a TCP port number in [1, 65535].
uint16_t parse_port(const std::string& value, const std::string& field_name);

} // namespace mergington
