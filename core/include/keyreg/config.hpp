#pragma once

#include <string>

namespace keyreg {

// Settings for the register tool, usually read from a YAML file:
//
//   port: 8080
//   name: alice
//   key_file: /home/alice/.keys/alice.pub
struct ClientConfig {
    int port = 0;
    std::string name;
    std::string key;       // Inline key, takes precedence over key_file
    std::string key_file;
};

// Parse YAML content, throws std::runtime_error on malformed input
ClientConfig parse_config(const std::string& yaml);

// Load from file, throws std::runtime_error if it cannot be read or parsed
ClientConfig load_config(const std::string& file_path);

// The key to register: inline key, else key_file contents without trailing whitespace
std::string resolve_key(const ClientConfig& config);

} // namespace keyreg
