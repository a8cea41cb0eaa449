#include "keyreg/network.hpp"
#include <cctype>
#include <stdexcept>
#include <string>

namespace keyreg {
namespace network {

bool is_valid_port(int port) {
    return port > 0 && port <= 65535;
}

int parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        throw std::invalid_argument("Invalid port: '" + text + "'");
    }

    // std::stoi would accept "+80", " 80" and "80abc"
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid port: '" + text + "'");
        }
    }

    int port = std::stoi(text);
    if (!is_valid_port(port)) {
        throw std::invalid_argument("Port out of range (1-65535): " + text);
    }
    return port;
}

std::string local_url(int port, const std::string& path) {
    if (!is_valid_port(port)) {
        throw std::invalid_argument("Port out of range (1-65535): " + std::to_string(port));
    }
    return std::string("http://") + LOCAL_HOST + ":" + std::to_string(port) + path;
}

std::string registration_url(int port) {
    return local_url(port, REGISTER_PATH);
}

} // namespace network
} // namespace keyreg
