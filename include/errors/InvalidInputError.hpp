#pragma once

#include <stdexcept>
#include <string>

namespace errors {

// Raised at the API boundary for malformed boxes and invalid configuration.
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace errors
