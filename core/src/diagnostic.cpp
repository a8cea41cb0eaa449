#include "keyreg/diagnostic.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <sstream>

namespace keyreg {

using json = nlohmann::json;

namespace {

// Error documents served by the registration endpoint: {"message": ..., "detail": ...}
// and nothing else, so no content is lost by rendering them as "message: detail"
bool is_error_document(const json& value) {
    if (!value.is_object() || !value.contains("message") || !value["message"].is_string()) {
        return false;
    }
    for (const auto& item : value.items()) {
        if (item.key() != "message" && item.key() != "detail") {
            return false;
        }
    }
    if (!value.contains("detail")) {
        return true;
    }
    return value["detail"].is_string() || value["detail"].is_null();
}

std::string describe_structured(const json& value) {
    if (is_error_document(value)) {
        std::string text = value["message"].get<std::string>();
        if (value.contains("detail") && value["detail"].is_string()) {
            text += ": " + value["detail"].get<std::string>();
        }
        return text;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

} // namespace

Diagnostic decode_diagnostic(const std::string& body) {
    try {
        return StructuredDiagnostic{json::parse(body)};
    } catch (const json::exception& e) {
        // parse_error for malformed input, out_of_range for numbers beyond a double
        VLOG(1) << "Response body is not usable JSON, keeping raw text: " << e.what();
        return TextDiagnostic{body};
    }
}

std::string describe(const Diagnostic& diagnostic) {
    if (const auto* structured = std::get_if<StructuredDiagnostic>(&diagnostic)) {
        return describe_structured(structured->value);
    }
    return std::get<TextDiagnostic>(diagnostic).text;
}

std::string to_string(const RegistrationOutcome& outcome) {
    if (outcome.ok()) {
        return "registered";
    }

    std::ostringstream oss;
    oss << "rejected (HTTP " << outcome.http_status << ")";
    if (outcome.diagnostic) {
        oss << ": " << describe(*outcome.diagnostic);
    }
    return oss.str();
}

} // namespace keyreg
