#include "tools/tool_registry.hpp"

#include <algorithm>
#include <sstream>

#include "utils/logging.hpp"

namespace filecron::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json ToolRegistry::Invoke(const std::string& tool_name, const nlohmann::json& arguments) {
    auto tool = Get(tool_name);
    if (!tool) {
        throw ToolError("tool '" + tool_name + "' not found");
    }
    utils::Log({utils::LogLevel::kDebug, "tool", "start",
                {{"name", tool_name}, {"args", arguments.dump(-1, ' ', false,
                                                              nlohmann::json::error_handler_t::replace)}}});
    auto result = tool->Execute(arguments);
    std::ostringstream size;
    size << (result.is_string() ? result.get_ref<const std::string&>().size()
                                : result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size());
    utils::Log({utils::LogLevel::kDebug, "tool", "end", {{"name", tool_name}, {"size", size.str()}}});
    return result;
}

}  // namespace filecron::tools
