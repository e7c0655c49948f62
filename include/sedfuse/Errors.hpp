#pragma once
#include <stdexcept>
#include <string>

namespace sedfuse {

// Raised for problems detected while validating the run configuration
// (grammar patterns, output template, settings file). Always fatal.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace sedfuse
