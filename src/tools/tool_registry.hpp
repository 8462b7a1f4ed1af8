#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "tools/tool.hpp"

namespace filecron::tools {

// Register everything before the scheduler starts; Invoke may then run
// concurrently from several workers.
class ToolRegistry : public ToolInvoker {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    std::vector<std::string> List() const;

    nlohmann::json Invoke(const std::string& tool_name, const nlohmann::json& arguments) override;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace filecron::tools
