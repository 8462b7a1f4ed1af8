#pragma once

#include <string>
#include <vector>

namespace filecron::config {

struct SchedulerConfig {
    std::string task_dir = "~/.filecron/tasks";
    int rescan_interval_s = 60;
    int summary_limit = 500;
    std::vector<std::string> prompt_prefix_tools = {"AgentAssistant"};
    bool debug = false;
};

struct ServerConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct NotifyConfig {
    std::string webhook_url;
    std::string webhook_path = "/";
    int history = 100;
};

struct PluginConfig {
    std::string name;
    std::string command;
    std::string working_dir;
    int timeout_s = 60;
};

struct ToolsConfig {
    std::vector<PluginConfig> plugins;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    SchedulerConfig scheduler;
    ServerConfig server;
    NotifyConfig notify;
    ToolsConfig tools;
    LogSettings log;
};

}  // namespace filecron::config
