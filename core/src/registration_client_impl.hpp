#pragma once

#include <keyreg/registration.hpp>
#include <keyreg/transport.hpp>
#include <memory>

namespace keyreg {

class RegistrationClientImpl : public RegistrationClient {
public:
    explicit RegistrationClientImpl(std::unique_ptr<HttpTransport> transport);
    ~RegistrationClientImpl() override = default;

    RegistrationOutcome register_identity(
        int port,
        const std::string& name,
        const std::string& key) override;

    RegistrationOutcome register_identity(const RegistrationRequest& request) override;

private:
    // Serialize the request body: {"name": ..., "key": ...}
    static std::string build_body(const RegistrationRequest& request);

    // Map a received response to an outcome
    static RegistrationOutcome interpret(const HttpResponse& response);

    std::unique_ptr<HttpTransport> transport_;
};

} // namespace keyreg
