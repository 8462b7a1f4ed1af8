#pragma once

#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace filecron::tools {

class ToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // Called from worker threads; throws ToolError on failure.
    virtual nlohmann::json Execute(const nlohmann::json& arguments) = 0;
};

// The backend a task's effect is delegated to.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;
    virtual nlohmann::json Invoke(const std::string& tool_name, const nlohmann::json& arguments) = 0;
};

}  // namespace filecron::tools
