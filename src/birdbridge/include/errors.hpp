#pragma once
#include <stdexcept>
#include <string>

// Missing or invalid setup, e.g. starting the detector without a source.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// An external tool could not be launched or exited unsuccessfully.
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& what) : std::runtime_error(what) {}
};
