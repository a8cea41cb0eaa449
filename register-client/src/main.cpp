#include <keyreg/keyreg.hpp>
#include <glog/logging.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Publish a name and its public key to the local registration service.\n"
              << "Options:\n"
              << "  --config=FILE         YAML file with port, name, key or key_file\n"
              << "  --port=PORT           Port of the service on localhost\n"
              << "  --name=NAME           Identity name to register\n"
              << "  --key=KEY             Public key to register\n"
              << "  --key-file=FILE       Read the public key from FILE\n"
              << "  --help, -h            Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize Google logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    std::string config_file;
    std::string port_arg;
    keyreg::ClientConfig overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0) {
            config_file = arg.substr(9);
        } else if (arg.find("--port=") == 0) {
            port_arg = arg.substr(7);
        } else if (arg.find("--name=") == 0) {
            overrides.name = arg.substr(7);
        } else if (arg.find("--key=") == 0) {
            overrides.key = arg.substr(6);
        } else if (arg.find("--key-file=") == 0) {
            overrides.key_file = arg.substr(11);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    keyreg::ClientConfig config;
    std::string key;

    try {
        if (!config_file.empty()) {
            config = keyreg::load_config(config_file);
        }

        // Command line wins over the config file
        if (!port_arg.empty()) {
            config.port = keyreg::network::parse_port(port_arg);
        }
        if (!overrides.name.empty()) {
            config.name = overrides.name;
        }
        if (!overrides.key.empty() || !overrides.key_file.empty()) {
            config.key = overrides.key;
            config.key_file = overrides.key_file;
        }

        if (config.port == 0) {
            throw std::invalid_argument("No port given (--port or 'port' in config)");
        }
        if (config.name.empty()) {
            throw std::invalid_argument("No name given (--name or 'name' in config)");
        }
        key = keyreg::resolve_key(config);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        auto client = keyreg::RegistrationClient::create();
        auto outcome = keyreg::register_and_report(*client, config.port, config.name, key, std::cout);
        if (outcome.ok()) {
            std::cout << "registered " << config.name << std::endl;
        }
    } catch (const keyreg::TransportError& e) {
        LOG(ERROR) << "Registration failed: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Registration aborted: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // A rejected registration has been reported and is not an error for the process
    return 0;
}
