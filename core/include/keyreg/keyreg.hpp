#pragma once

// Main header file for the keyreg client library

#include "keyreg/types.hpp"
#include "keyreg/network.hpp"
#include "keyreg/transport.hpp"
#include "keyreg/diagnostic.hpp"
#include "keyreg/registration.hpp"
#include "keyreg/config.hpp"

namespace keyreg {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace keyreg
