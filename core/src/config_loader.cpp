#include "keyreg/config.hpp"
#include "keyreg/network.hpp"
#include <yaml-cpp/yaml.h>
#include <glog/logging.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace keyreg {

namespace {

std::string optional_string(const YAML::Node& root, const char* field) {
    const YAML::Node node = root[field];
    if (!node) {
        return "";
    }
    if (!node.IsScalar()) {
        throw std::runtime_error(std::string("Config field '") + field + "' must be a string");
    }
    return node.as<std::string>();
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

ClientConfig parse_config(const std::string& yaml) {
    ClientConfig config;
    YAML::Node root;

    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse client config: " << e.what();
        throw std::runtime_error("Invalid client config: " + std::string(e.what()));
    }

    // An empty document leaves every setting to the command line
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid client config: top level must be a mapping");
    }

    if (root["port"]) {
        try {
            config.port = root["port"].as<int>();
        } catch (const YAML::Exception&) {
            throw std::runtime_error("Config field 'port' must be an integer");
        }
        if (!network::is_valid_port(config.port)) {
            throw std::runtime_error("Config field 'port' out of range (1-65535): " +
                                     std::to_string(config.port));
        }
    }

    config.name = optional_string(root, "name");
    config.key = optional_string(root, "key");
    config.key_file = optional_string(root, "key_file");
    return config;
}

ClientConfig load_config(const std::string& file_path) {
    LOG(INFO) << "Loading client config from " << file_path;
    return parse_config(read_file(file_path));
}

std::string resolve_key(const ClientConfig& config) {
    if (!config.key.empty()) {
        return config.key;
    }
    if (config.key_file.empty()) {
        throw std::runtime_error("No key configured: set 'key' or 'key_file'");
    }

    std::string key = read_file(config.key_file);
    size_t end = key.find_last_not_of(" \t\r\n");
    key.erase(end == std::string::npos ? 0 : end + 1);

    if (key.empty()) {
        throw std::runtime_error("Key file is empty: " + config.key_file);
    }
    return key;
}

} // namespace keyreg
