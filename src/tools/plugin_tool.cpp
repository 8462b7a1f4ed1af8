#include "tools/plugin_tool.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace filecron::tools {
namespace bp = boost::process;
namespace {

std::filesystem::path TempPath(const std::string& kind) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1));
    return std::filesystem::temp_directory_path() / ("filecron_" + kind + "_" + stamp + ".log");
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

}  // namespace

PluginTool::PluginTool(PluginSpec spec)
    : spec_(std::move(spec)) {}

nlohmann::json PluginTool::Execute(const nlohmann::json& arguments) {
    const auto result = RunProcess(
        spec_.command,
        arguments.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
        spec_.working_dir,
        spec_.timeout);
    if (!result.error.empty()) {
        utils::LogDebug("plugin", spec_.name + " stderr: " + result.error);
    }
    if (result.timed_out) {
        throw ToolError("plugin '" + spec_.name + "' timed out");
    }
    if (result.exit_code != 0) {
        throw ToolError("plugin '" + spec_.name + "' exited with code " +
                        std::to_string(result.exit_code) +
                        (result.error.empty() ? "" : ": " + result.error));
    }
    return ParseResponse(result.output);
}

ProcessResult PluginTool::RunProcess(const std::string& command,
                                     const std::string& input,
                                     const std::string& working_dir,
                                     std::chrono::seconds timeout) {
    ProcessResult result{};
    const auto stdin_path = TempPath("stdin");
    const auto stdout_path = TempPath("stdout");
    const auto stderr_path = TempPath("stderr");
    {
        std::ofstream output(stdin_path, std::ios::trunc);
        output << input;
    }

    try {
        const std::string start_dir = working_dir.empty()
            ? std::filesystem::current_path().string()
            : working_dir;
        bp::child child_process(
            "/bin/sh",
            "-c",
            command,
            bp::start_dir = start_dir,
            bp::std_in < stdin_path.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        int status = 0;
        const pid_t pid = child_process.id();
        bool finished = WaitUntil(pid, std::chrono::steady_clock::now() + timeout, status);
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, std::chrono::steady_clock::now() + std::chrono::seconds(2), status);
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        // Reaped by hand above; the child object must not try again.
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadFile(stdout_path);
    const auto stderr_text = ReadFile(stderr_path);
    if (!stderr_text.empty()) {
        result.error = result.error.empty() ? stderr_text : result.error + "\n" + stderr_text;
    }

    std::error_code ec;
    std::filesystem::remove(stdin_path, ec);
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

nlohmann::json PluginTool::ParseResponse(const std::string& output) {
    // Plugins may log before the response; the last non-empty line carries it.
    std::istringstream stream(output);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            last = line;
        }
    }
    if (last.empty()) {
        throw ToolError("plugin produced no output");
    }
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(last);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ToolError(std::string("plugin output is not JSON: ") + ex.what());
    }
    if (!response.is_object() || !response.contains("status")) {
        throw ToolError("plugin response has no status");
    }
    const auto status = response.value("status", "");
    nlohmann::json payload = response.contains("result") ? response["result"] : nlohmann::json(nullptr);
    if (status != "success") {
        throw ToolError(payload.is_string() ? payload.get<std::string>()
                                            : "plugin reported " + status + ": " + payload.dump());
    }
    return payload;
}

}  // namespace filecron::tools
