#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace keyreg {

// Caller's intent for a single registration call
struct RegistrationRequest {
    int target_port = 0;
    std::string name;
    std::string key;
};

// Diagnostic decoded from a JSON response body
struct StructuredDiagnostic {
    nlohmann::json value;
};

// Raw response text, used when the body is not valid JSON
struct TextDiagnostic {
    std::string text;
};

using Diagnostic = std::variant<StructuredDiagnostic, TextDiagnostic>;

// Result of a registration that reached the server
struct RegistrationOutcome {
    enum class Status {
        SUCCESS,   // Server accepted the name/key pair
        FAILURE    // Server answered with a non-2xx status
    };

    Status status = Status::FAILURE;
    long http_status = 0;
    std::optional<Diagnostic> diagnostic;  // Only set for FAILURE

    static RegistrationOutcome success(long http_status) {
        RegistrationOutcome outcome;
        outcome.status = Status::SUCCESS;
        outcome.http_status = http_status;
        return outcome;
    }

    static RegistrationOutcome failure(long http_status, Diagnostic diagnostic) {
        RegistrationOutcome outcome;
        outcome.status = Status::FAILURE;
        outcome.http_status = http_status;
        outcome.diagnostic = std::move(diagnostic);
        return outcome;
    }

    bool ok() const { return status == Status::SUCCESS; }
    explicit operator bool() const { return ok(); }
};

} // namespace keyreg
