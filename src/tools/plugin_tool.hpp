#pragma once

#include <chrono>
#include <string>

#include "tools/tool.hpp"

namespace filecron::tools {

struct PluginSpec {
    std::string name;
    std::string command;
    std::string working_dir;
    std::chrono::seconds timeout{60};
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

// Runs an external plugin process: arguments JSON on stdin, one JSON object
// {"status": "success"|"error", "result": ...} on stdout.
class PluginTool : public Tool {
public:
    explicit PluginTool(PluginSpec spec);

    std::string Name() const override { return spec_.name; }
    std::string Description() const override { return "External plugin: " + spec_.command; }
    nlohmann::json Execute(const nlohmann::json& arguments) override;

    static ProcessResult RunProcess(const std::string& command,
                                    const std::string& input,
                                    const std::string& working_dir,
                                    std::chrono::seconds timeout);

    // Interprets plugin stdout; throws ToolError on an error status or bad output.
    static nlohmann::json ParseResponse(const std::string& output);

private:
    PluginSpec spec_;
};

}  // namespace filecron::tools
