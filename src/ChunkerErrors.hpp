#pragma once
#include <stdexcept>
#include <string>

// The file could not be memory-mapped (permission, unsupported file type, resource exhaustion).
class MappingError : public std::runtime_error {
public:
    explicit MappingError(const std::string& message)
        : std::runtime_error("mapping error: " + message) {}
};

// The caller asked for something structurally invalid, e.g. zero chunks.
class InvalidRequest : public std::invalid_argument {
public:
    explicit InvalidRequest(const std::string& message)
        : std::invalid_argument("invalid request: " + message) {}
};
