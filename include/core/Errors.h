#pragma once
#include <stdexcept>
#include <string>

// Raised for anything wrong with a run's setup: unknown strategy or pattern,
// malformed seed, non-positive bounds or step counts. Always thrown before the
// engine enters Running.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};
