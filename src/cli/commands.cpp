#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <unistd.h>

#include "bus/event_log.hpp"
#include "bus/message_bus.hpp"
#include "bus/webhook_sink.hpp"
#include "config/config_loader.hpp"
#include "scheduler/change_watcher.hpp"
#include "scheduler/event_loop.hpp"
#include "scheduler/scheduler_service.hpp"
#include "tasks/task_store.hpp"
#include "tasks/timestamp.hpp"
#include "tools/echo_tool.hpp"
#include "tools/plugin_tool.hpp"
#include "tools/tool_registry.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return filecron::utils::GetHomePath() / ".filecron" / "scheduler.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    const auto path = GetPidFilePath();
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

void ApplyLogSettings(const filecron::config::Config& config) {
    filecron::utils::LogConfig log_config{};
    log_config.min_level = filecron::utils::LogLevelFromString(config.log.level);
    if (config.scheduler.debug) {
        log_config.min_level = filecron::utils::LogLevel::kDebug;
    }
    filecron::utils::SetLogConfig(log_config);
}

void RegisterTools(filecron::tools::ToolRegistry& tools, const filecron::config::Config& config) {
    tools.Register(std::make_unique<filecron::tools::EchoTool>());
    for (const auto& plugin : config.tools.plugins) {
        filecron::tools::PluginSpec spec{};
        spec.name = plugin.name;
        spec.command = plugin.command;
        spec.working_dir = filecron::utils::ExpandHome(plugin.working_dir).string();
        spec.timeout = std::chrono::seconds(plugin.timeout_s > 0 ? plugin.timeout_s : 60);
        tools.Register(std::make_unique<filecron::tools::PluginTool>(spec));
    }
    filecron::utils::LogInfo("tools", "registered: " + filecron::utils::Join(tools.List(), ", "));
}

filecron::scheduler::SchedulerOptions BuildSchedulerOptions(const filecron::config::Config& config) {
    filecron::scheduler::SchedulerOptions options{};
    options.rescan_interval = std::chrono::seconds(std::max(0, config.scheduler.rescan_interval_s));
    options.executor.summary_limit =
        static_cast<std::size_t>(std::max(1, config.scheduler.summary_limit));
    options.executor.prompt_prefix_tools = config.scheduler.prompt_prefix_tools;
    return options;
}

nlohmann::json BuildEntryJson(const filecron::scheduler::ScheduledEntry& entry) {
    return {
        {"taskId", entry.task_id},
        {"file", entry.path.filename().string()},
        {"scheduledLocalTime", entry.scheduled_local_time},
        {"dueAtMs", filecron::utils::ToEpochMs(entry.due)},
        {"toolName", entry.tool_name},
        {"recurring", entry.recurring}
    };
}

int RunScheduler() {
    const auto config = filecron::config::LoadConfig();
    ApplyLogSettings(config);

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "filecron already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();

    filecron::tasks::TaskStore store(filecron::utils::ExpandHome(config.scheduler.task_dir));
    try {
        store.EnsureDirectory();
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cout << "Cannot create task directory " << store.Directory() << ": " << ex.what() << std::endl;
        return 1;
    }

    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write scheduler pid file." << std::endl;
        return 1;
    }

    filecron::tools::ToolRegistry tools;
    RegisterTools(tools, config);

    filecron::bus::MessageBus bus;
    filecron::bus::EventLog history(static_cast<std::size_t>(std::max(1, config.notify.history)));
    bus.Subscribe([](const filecron::bus::ExecutionEvent& event) {
        std::cout << event.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
    });
    bus.Subscribe([&history](const filecron::bus::ExecutionEvent& event) {
        history.Append(event);
    });
    if (!config.notify.webhook_url.empty()) {
        bus.Subscribe(filecron::bus::WebhookSink(config.notify.webhook_url, config.notify.webhook_path));
    }
    bus.Start();
    std::thread bus_thread([&bus]() { bus.DispatchEvents(); });

    filecron::scheduler::EventLoop loop;
    filecron::scheduler::SchedulerService service(loop, store, tools, bus, BuildSchedulerOptions(config));
    filecron::scheduler::ChangeWatcher watcher(
        store.Directory(),
        [&loop, &service](const std::string& filename) {
            loop.Post([&service, filename]() { service.OnFileChanged(filename); });
        },
        [&loop, &service]() {
            loop.Post([&service]() { service.ReconcileAll(); });
        });

    // Queued ahead of any watcher event, and run only once the watch exists.
    loop.Post([&service]() { service.Start(); });
    if (!watcher.Start()) {
        filecron::utils::LogWarn("main", "change notifications unavailable; relying on periodic rescan");
    }
    loop.Start();

    httplib::Server http_server;
    http_server.Get("/tasks", [&service](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = nlohmann::json::object();
        json["pending"] = nlohmann::json::array();
        for (const auto& entry : service.Registry().Snapshot()) {
            json["pending"].push_back(BuildEntryJson(entry));
        }
        json["firing"] = service.Registry().FiringCount();
        res.set_content(json.dump(2), "application/json");
    });
    http_server.Get("/events", [&history](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& event : history.Recent()) {
            json.push_back(event.ToJson());
        }
        res.set_content(json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    });
    http_server.Get("/health", [&service](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = {
            {"status", "ok"},
            {"pending", service.Registry().Size()}
        };
        res.set_content(json.dump(), "application/json");
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::thread http_thread;
    if (config.server.enabled) {
        const std::string host = config.server.host;
        const int port = config.server.port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                filecron::utils::LogError("http", "status server failed to listen on " + host + ":" +
                                                      std::to_string(port));
            }
        });
    }

    std::cout << "filecron started, watching " << store.Directory().string()
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    filecron::utils::LogInfo("main", "signal " + std::to_string(g_signal) + " received, shutting down");

    if (http_thread.joinable()) {
        http_server.stop();
        http_thread.join();
    }
    watcher.Stop();
    loop.Post([&service]() { service.Stop(); });
    loop.Stop();
    bus.Stop();
    if (bus_thread.joinable()) {
        bus_thread.join();
    }
    RemovePidFile();
    return 0;
}

int ListTasks() {
    const auto config = filecron::config::LoadConfig();
    filecron::tasks::TaskStore store(filecron::utils::ExpandHome(config.scheduler.task_dir));

    struct Row {
        std::string file;
        filecron::tasks::LoadResult loaded;
        std::optional<filecron::tasks::Timestamp> due;
    };
    std::vector<Row> rows;
    for (const auto& path : store.ListRecordFiles()) {
        Row row{path.filename().string(), store.Load(path), std::nullopt};
        if (row.loaded.status == filecron::tasks::LoadStatus::kOk) {
            row.due = filecron::tasks::ParseTimestamp(row.loaded.record.scheduled_local_time);
        }
        rows.push_back(std::move(row));
    }
    if (rows.empty()) {
        std::cout << "No pending tasks in " << store.Directory().string() << std::endl;
        return 0;
    }
    std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        if (!a.due.has_value() || !b.due.has_value()) {
            return a.due.has_value() && !b.due.has_value();
        }
        return a.due->instant < b.due->instant;
    });

    const auto now = std::chrono::system_clock::now();
    std::cout << rows.size() << " task file(s) in " << store.Directory().string() << ":" << std::endl;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        std::cout << std::endl << "[" << (i + 1) << "] ";
        if (row.loaded.status != filecron::tasks::LoadStatus::kOk) {
            std::cout << "INVALID  " << row.file << ": " << row.loaded.error << std::endl;
            continue;
        }
        const auto& record = row.loaded.record;
        std::cout << (row.due->instant < now ? "EXPIRED (fires on discovery)" : "PENDING");
        if (record.IsRecurring()) {
            std::cout << "  every " << record.interval_s.value() << "s";
        }
        std::cout << std::endl
                  << "    id        : " << record.task_id << std::endl
                  << "    time      : " << record.scheduled_local_time << std::endl
                  << "    tool      : " << record.tool_call.tool_name << std::endl
                  << "    arguments : " << record.tool_call.arguments.dump() << std::endl;
    }
    return 0;
}

int CheckTask(const std::string& file) {
    const std::filesystem::path path(file);
    filecron::tasks::TaskStore store(path.has_parent_path() ? path.parent_path()
                                                            : std::filesystem::current_path());
    const auto loaded = store.Load(path);
    if (loaded.status != filecron::tasks::LoadStatus::kOk) {
        std::cout << file << ": invalid: " << loaded.error << std::endl;
        return 1;
    }
    std::cout << file << ": ok, task " << loaded.record.task_id << " at "
              << loaded.record.scheduled_local_time;
    if (loaded.record.IsRecurring()) {
        std::cout << " every " << loaded.record.interval_s.value() << "s";
    }
    std::cout << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "run") {
        return RunScheduler();
    }

    if (argc >= 2 && std::string(argv[1]) == "list") {
        return ListTasks();
    }

    if (argc >= 3 && std::string(argv[1]) == "check") {
        return CheckTask(argv[2]);
    }

    std::cout << "Usage: filecron run | filecron list | filecron check <task.json>" << std::endl;
    return 1;
}
