#ifndef CONFIGURATION_ERROR_HPP
#define CONFIGURATION_ERROR_HPP

#include <stdexcept>
#include <string>

// Raised at construction time when a configuration cannot work at run time.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

#endif
