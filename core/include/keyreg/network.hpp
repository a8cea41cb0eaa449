#pragma once

#include <string>

namespace keyreg {
namespace network {

constexpr const char* LOCAL_HOST = "localhost";
constexpr const char* REGISTER_PATH = "/api/register";

// True for TCP ports in 1-65535
bool is_valid_port(int port);

// Parse a decimal port number, throws std::invalid_argument if it is not a valid port
int parse_port(const std::string& text);

// http://localhost:<port><path>
std::string local_url(int port, const std::string& path);

// Registration endpoint on the local host
std::string registration_url(int port);

} // namespace network
} // namespace keyreg
