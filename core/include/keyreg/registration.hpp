#pragma once

#include "keyreg/transport.hpp"
#include "keyreg/types.hpp"
#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>

namespace keyreg {

// Limit for the whole exchange with the registration endpoint
constexpr std::chrono::milliseconds REGISTRATION_TIMEOUT{10000};

class RegistrationClient {
public:
    virtual ~RegistrationClient() = default;

    // Create a client using the libcurl transport
    static std::unique_ptr<RegistrationClient> create();

    // Create a client on top of a caller supplied transport
    static std::unique_ptr<RegistrationClient> create(std::unique_ptr<HttpTransport> transport);

    // Publish a name and its public key to the server on localhost:port.
    // Throws TransportError when no response arrives and std::invalid_argument for a bad port.
    virtual RegistrationOutcome register_identity(
        int port,
        const std::string& name,
        const std::string& key) = 0;

    virtual RegistrationOutcome register_identity(const RegistrationRequest& request) = 0;
};

// Print a failure diagnostic to out. Success prints nothing.
void report(const RegistrationOutcome& outcome, std::ostream& out);

// Register, then report the outcome
RegistrationOutcome register_and_report(
    RegistrationClient& client,
    int port,
    const std::string& name,
    const std::string& key,
    std::ostream& out);

} // namespace keyreg
