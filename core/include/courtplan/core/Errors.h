#pragma once

#include <stdexcept>
#include <string>

namespace courtplan::core {

// Raised when an engine cannot be built from the roster or configuration it was given.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace courtplan::core
