#pragma once

#include "keyreg/types.hpp"
#include <string>

namespace keyreg {

// Decode a failure response body: JSON first, raw text when that fails
Diagnostic decode_diagnostic(const std::string& body);

// Human-readable rendering of a diagnostic
std::string describe(const Diagnostic& diagnostic);

// One-line summary of an outcome
std::string to_string(const RegistrationOutcome& outcome);

} // namespace keyreg
