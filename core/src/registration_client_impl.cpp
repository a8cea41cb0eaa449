#include "registration_client_impl.hpp"
#include <keyreg/diagnostic.hpp>
#include <keyreg/network.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>

namespace keyreg {

using json = nlohmann::json;

RegistrationClientImpl::RegistrationClientImpl(std::unique_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("RegistrationClient requires a transport");
    }
}

RegistrationOutcome RegistrationClientImpl::register_identity(
    int port,
    const std::string& name,
    const std::string& key) {

    RegistrationRequest request;
    request.target_port = port;
    request.name = name;
    request.key = key;
    return register_identity(request);
}

RegistrationOutcome RegistrationClientImpl::register_identity(const RegistrationRequest& request) {
    std::string url = network::registration_url(request.target_port);
    std::string body = build_body(request);

    LOG(INFO) << "Registering '" << request.name << "' at " << url;

    HttpResponse response;
    try {
        response = transport_->post_json(url, body, REGISTRATION_TIMEOUT);
    } catch (const TransportError& e) {
        LOG(ERROR) << "Registration of '" << request.name << "' did not complete ("
                   << to_string(e.kind()) << "): " << e.what();
        throw;
    }

    RegistrationOutcome outcome = interpret(response);
    if (outcome.ok()) {
        LOG(INFO) << "Registered '" << request.name << "' (HTTP " << response.status_code << ")";
    } else {
        LOG(WARNING) << "Registration of '" << request.name << "' " << to_string(outcome);
    }
    return outcome;
}

std::string RegistrationClientImpl::build_body(const RegistrationRequest& request) {
    json body;
    body["name"] = request.name;
    body["key"] = request.key;
    return body.dump();
}

RegistrationOutcome RegistrationClientImpl::interpret(const HttpResponse& response) {
    // The body of an accepted registration carries nothing of interest
    if (response.is_success()) {
        return RegistrationOutcome::success(response.status_code);
    }
    return RegistrationOutcome::failure(response.status_code, decode_diagnostic(response.body));
}

std::unique_ptr<RegistrationClient> RegistrationClient::create() {
    return std::make_unique<RegistrationClientImpl>(HttpTransport::create());
}

std::unique_ptr<RegistrationClient> RegistrationClient::create(std::unique_ptr<HttpTransport> transport) {
    return std::make_unique<RegistrationClientImpl>(std::move(transport));
}

void report(const RegistrationOutcome& outcome, std::ostream& out) {
    if (outcome.ok() || !outcome.diagnostic) {
        return;
    }
    out << describe(*outcome.diagnostic) << std::endl;
}

RegistrationOutcome register_and_report(
    RegistrationClient& client,
    int port,
    const std::string& name,
    const std::string& key,
    std::ostream& out) {

    RegistrationOutcome outcome = client.register_identity(port, name, key);
    report(outcome, out);
    return outcome;
}

} // namespace keyreg
