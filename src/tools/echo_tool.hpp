#pragma once

#include <string>

#include "tools/tool.hpp"

namespace filecron::tools {

// Returns "msg" when present, otherwise the arguments unchanged.
class EchoTool : public Tool {
public:
    std::string Name() const override { return "Echo"; }
    std::string Description() const override { return "Echo the arguments back."; }
    nlohmann::json Execute(const nlohmann::json& arguments) override;
};

}  // namespace filecron::tools
