#pragma once

#include <stdexcept>
#include <string>

// Malformed configuration or band mask; raised before any router call.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Router unreachable or answered with a non-2xx status.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};
