#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "gateway/http_gateway.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "service/sandbox_service.hpp"
#include "service/wire_format.hpp"
#include "validator/static_validator.hpp"

namespace {

constexpr int kExitRejected = 2;
constexpr int kExitTimedOut = 124;
constexpr int kExitRunnerError = 125;
constexpr int kExitCancelled = 130;
constexpr long long kRunWaitSlackMs = 30000;

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;
const char* g_argv0 = nullptr;

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetPidFilePath() {
    return GetHomePath() / ".sandbar" / "gateway.pid";
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

bool WaitForExit(pid_t pid, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsProcessRunning(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !IsProcessRunning(pid);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

std::optional<std::string> ReadSourceFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

sandbar::config::Config LoadAndConfigure() {
    auto config = sandbar::config::LoadConfig();
    sandbar::utils::ConfigureLogging(config.logging);
    return config;
}

int RunOnce(const std::string& language, const std::string& file, const std::optional<long long>& timeout_ms) {
    const auto source = ReadSourceFile(file);
    if (!source) {
        std::cerr << "Cannot read " << file << std::endl;
        return 1;
    }
    auto config = LoadAndConfigure();
    sandbar::service::SandboxService service(config);
    service.Start();

    sandbar::service::SubmitRequest request;
    request.source_code = *source;
    request.language = language;
    request.options.timeout_ms = timeout_ms;
    const auto response = service.Submit(request);
    switch (response.status) {
        case sandbar::service::SubmitStatus::kAccepted:
            break;
        case sandbar::service::SubmitStatus::kRejected:
            std::cerr << sandbar::service::Dump(sandbar::service::SubmitResponseToJson(response), 2) << std::endl;
            return kExitRejected;
        case sandbar::service::SubmitStatus::kSaturated:
        case sandbar::service::SubmitStatus::kInvalid:
            std::cerr << response.message << std::endl;
            return 1;
    }

    const auto bound = std::chrono::milliseconds(response.options.timeout_ms + kRunWaitSlackMs);
    const auto result = service.Wait(response.execution_id, bound);
    if (!result) {
        std::cerr << "Execution " << response.execution_id << " did not finish." << std::endl;
        service.Cancel(response.execution_id);
        return kExitRunnerError;
    }
    std::cout << result->stdout_text << std::flush;
    std::cerr << result->stderr_text;
    if (result->output_truncated) {
        std::cerr << "\n[output truncated]";
    }
    std::cerr << std::flush;

    switch (result->termination_reason) {
        case sandbar::sandbox::TerminationReason::kNormal:
            if (result->exit_code) {
                return *result->exit_code;
            }
            // Killed by a signal the sandbox does not classify.
            return kExitRunnerError;
        case sandbar::sandbox::TerminationReason::kTimeout:
        case sandbar::sandbox::TerminationReason::kResourceLimit:
            std::cerr << "[" << sandbar::sandbox::ToString(result->termination_reason) << " after "
                      << result->elapsed_ms << " ms]" << std::endl;
            return kExitTimedOut;
        case sandbar::sandbox::TerminationReason::kRunnerError:
            std::cerr << "runner error: " << result->error << std::endl;
            return kExitRunnerError;
        case sandbar::sandbox::TerminationReason::kCancelled:
            return kExitCancelled;
    }
    return kExitRunnerError;
}

int ValidateOnce(const std::string& language_name, const std::string& file) {
    const auto source = ReadSourceFile(file);
    if (!source) {
        std::cerr << "Cannot read " << file << std::endl;
        return 1;
    }
    const auto language = sandbar::sandbox::ParseLanguage(language_name);
    if (!language) {
        std::cerr << "Unsupported language: " << language_name << std::endl;
        return 1;
    }
    auto config = LoadAndConfigure();
    sandbar::validator::StaticValidator validator(sandbar::sandbox::SandboxRegistry::FromConfig(config),
                                                  config.validator);
    const auto verdict = validator.Validate(*source, *language);
    std::cout << sandbar::service::Dump(sandbar::service::VerdictToJson(verdict), 2) << std::endl;
    return verdict.accepted ? 0 : kExitRejected;
}

int RunGateway() {
    auto config = LoadAndConfigure();

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "sandbar gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();

    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    sandbar::service::SandboxService service(config);
    sandbar::gateway::HttpGateway gateway(service, config.gateway);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    service.Start();
    if (!gateway.Start()) {
        service.Stop();
        RemovePidFile();
        return 1;
    }

    std::cout << "sandbar gateway started on " << config.gateway.host << ":" << gateway.Port()
              << ". Press Ctrl+C to stop." << std::endl;
    bool shutdown_guard_started = false;
    bool restart_requested = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            if (g_signal == SIGHUP) {
                restart_requested = true;
            }
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                // Running executions get their full timeout before the process is torn down.
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(35));
                    std::_Exit(130);
                }).detach();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    gateway.Stop();
    service.Stop();
    RemovePidFile();
    if (restart_requested && g_argv0) {
        const char* args[] = {g_argv0, "gateway", nullptr};
        ::execv(g_argv0, const_cast<char* const*>(args));
        std::cout << "Failed to restart gateway." << std::endl;
        return 1;
    }
    return 0;
}

int RestartGateway(const char* argv0) {
    const auto pid = ReadPidFile();
    if (pid && IsProcessRunning(*pid)) {
        ::kill(*pid, SIGTERM);
        WaitForExit(*pid, std::chrono::seconds(40));
    }
    RemovePidFile();

    const char* args[] = {argv0, "gateway", nullptr};
    ::execv(argv0, const_cast<char* const*>(args));
    std::cout << "Failed to restart gateway." << std::endl;
    return 1;
}

int HupGateway() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "sandbar gateway not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGHUP);
    return 0;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  sandbar_cli run <language> <file> [timeoutMs]\n"
              << "  sandbar_cli validate <language> <file>\n"
              << "  sandbar_cli gateway | sandbar_cli restart | sandbar_cli hup" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    g_argv0 = (argc > 0 ? argv[0] : nullptr);
    const std::string command = argc >= 2 ? argv[1] : "";

    if (command == "gateway") {
        return RunGateway();
    }
    if (command == "restart") {
        return RestartGateway(argv[0]);
    }
    if (command == "hup") {
        return HupGateway();
    }
    if (command == "run" && (argc == 4 || argc == 5)) {
        std::optional<long long> timeout_ms;
        if (argc == 5) {
            try {
                timeout_ms = std::stoll(argv[4]);
            } catch (const std::logic_error&) {
                std::cerr << "timeoutMs must be an integer" << std::endl;
                return 1;
            }
        }
        return RunOnce(argv[2], argv[3], timeout_ms);
    }
    if (command == "validate" && argc == 4) {
        return ValidateOnce(argv[2], argv[3]);
    }

    PrintUsage();
    return 1;
}
