#pragma once
#include <stdexcept>
#include <string>

namespace switchboard {

// Invalid configuration or server descriptor, raised at load time.
struct ConfigError : std::runtime_error {
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ToolNotFound : std::runtime_error {
    explicit ToolNotFound(const std::string& name)
        : std::runtime_error("Unknown tool: " + name), tool_name(name) {}
    std::string tool_name;
};

struct StorageError : std::runtime_error {
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace switchboard
