#include "tools/echo_tool.hpp"

namespace filecron::tools {

nlohmann::json EchoTool::Execute(const nlohmann::json& arguments) {
    if (arguments.is_object() && arguments.contains("msg")) {
        return arguments["msg"];
    }
    return arguments;
}

}  // namespace filecron::tools
