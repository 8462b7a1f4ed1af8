#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace filecron::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyPlugins(ToolsConfig& tools, const nlohmann::json& plugins) {
    if (!plugins.is_array()) {
        return;
    }
    tools.plugins.clear();
    for (const auto& item : plugins) {
        if (!item.is_object()) {
            continue;
        }
        PluginConfig plugin{};
        plugin.name = item.value("name", "");
        plugin.command = item.value("command", "");
        plugin.working_dir = item.value("workingDir", "");
        if (item.contains("timeoutS") && item["timeoutS"].is_number_integer()) {
            plugin.timeout_s = item["timeoutS"].get<int>();
        }
        if (plugin.name.empty() || plugin.command.empty()) {
            utils::LogWarn("config", "skipping plugin without name or command");
            continue;
        }
        tools.plugins.push_back(plugin);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return utils::GetHomePath() / ".filecron" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("scheduler") && data["scheduler"].is_object()) {
        const auto& scheduler = data["scheduler"];
        if (scheduler.contains("taskDir") && scheduler["taskDir"].is_string()) {
            config.scheduler.task_dir = scheduler["taskDir"].get<std::string>();
        }
        if (scheduler.contains("rescanIntervalS") && scheduler["rescanIntervalS"].is_number_integer()) {
            config.scheduler.rescan_interval_s = scheduler["rescanIntervalS"].get<int>();
        }
        if (scheduler.contains("summaryLimit") && scheduler["summaryLimit"].is_number_integer()) {
            config.scheduler.summary_limit = scheduler["summaryLimit"].get<int>();
        }
        if (scheduler.contains("promptPrefixTools") && scheduler["promptPrefixTools"].is_array()) {
            config.scheduler.prompt_prefix_tools.clear();
            for (const auto& item : scheduler["promptPrefixTools"]) {
                if (item.is_string()) {
                    config.scheduler.prompt_prefix_tools.push_back(item.get<std::string>());
                }
            }
        }
        if (scheduler.contains("debug") && scheduler["debug"].is_boolean()) {
            config.scheduler.debug = scheduler["debug"].get<bool>();
        }
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("enabled") && server["enabled"].is_boolean()) {
            config.server.enabled = server["enabled"].get<bool>();
        }
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        if (server.contains("port") && server["port"].is_number_integer()) {
            config.server.port = server["port"].get<int>();
        }
    }

    if (data.contains("notify") && data["notify"].is_object()) {
        const auto& notify = data["notify"];
        if (notify.contains("webhookUrl") && notify["webhookUrl"].is_string()) {
            config.notify.webhook_url = notify["webhookUrl"].get<std::string>();
        }
        if (notify.contains("webhookPath") && notify["webhookPath"].is_string()) {
            config.notify.webhook_path = notify["webhookPath"].get<std::string>();
        }
        if (notify.contains("history") && notify["history"].is_number_integer()) {
            config.notify.history = notify["history"].get<int>();
        }
    }

    if (data.contains("tools") && data["tools"].is_object()) {
        const auto& tools = data["tools"];
        if (tools.contains("plugins")) {
            ApplyPlugins(config.tools, tools["plugins"]);
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.level = log["level"].get<std::string>();
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto task_dir = GetEnvFallback("FILECRON_SCHEDULER__TASK_DIR", "TASK_DIR");
    if (!task_dir.empty()) {
        config.scheduler.task_dir = task_dir;
    }

    const auto rescan = GetEnv("FILECRON_SCHEDULER__RESCAN_INTERVAL_S");
    if (!rescan.empty()) {
        config.scheduler.rescan_interval_s = ParseInt(rescan, config.scheduler.rescan_interval_s);
    }

    const auto summary_limit = GetEnv("FILECRON_SCHEDULER__SUMMARY_LIMIT");
    if (!summary_limit.empty()) {
        config.scheduler.summary_limit = ParseInt(summary_limit, config.scheduler.summary_limit);
    }

    const auto prefix_tools = GetEnv("FILECRON_SCHEDULER__PROMPT_PREFIX_TOOLS");
    if (!prefix_tools.empty()) {
        config.scheduler.prompt_prefix_tools = SplitCsv(prefix_tools);
    }

    const auto debug = GetEnvFallback("FILECRON_SCHEDULER__DEBUG", "DEBUG_MODE");
    if (!debug.empty()) {
        config.scheduler.debug = ParseBool(debug);
    }

    const auto server_enabled = GetEnv("FILECRON_SERVER__ENABLED");
    if (!server_enabled.empty()) {
        config.server.enabled = ParseBool(server_enabled);
    }

    const auto server_host = GetEnv("FILECRON_SERVER__HOST");
    if (!server_host.empty()) {
        config.server.host = server_host;
    }

    const auto server_port = GetEnv("FILECRON_SERVER__PORT");
    if (!server_port.empty()) {
        config.server.port = ParseInt(server_port, config.server.port);
    }

    const auto webhook_url = GetEnv("FILECRON_NOTIFY__WEBHOOK_URL");
    if (!webhook_url.empty()) {
        config.notify.webhook_url = webhook_url;
    }

    const auto webhook_path = GetEnv("FILECRON_NOTIFY__WEBHOOK_PATH");
    if (!webhook_path.empty()) {
        config.notify.webhook_path = webhook_path;
    }

    const auto log_level = GetEnv("FILECRON_LOG__LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace filecron::config
