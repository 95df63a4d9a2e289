#include "runner/container_runner.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>

#include <boost/process.hpp>
#include <boost/process/search_path.hpp>

#include "runner/ephemeral_workspace.hpp"
#include "runner/isolation_policy.hpp"
#include "runner/process_runner.hpp"
#include "runner/supervised_process.hpp"
#include "utils/logging.hpp"

namespace sandbar::runner {
namespace bp = boost::process;

namespace {

constexpr int kRuntimeFailure = 125;
constexpr int kKilledBySignal9 = 137;
constexpr const char* kMountPoint = "/sandbox";

std::string FormatShare(double share) {
    std::ostringstream oss;
    oss << share;
    return oss.str();
}

}  // namespace

ContainerRunner::ContainerRunner(config::IsolationConfig config) : config_(std::move(config)) {
    const auto found = bp::search_path(config_.container_runtime);
    runtime_path_ = found.empty() ? config_.container_runtime : found.string();
}

std::string ContainerRunner::ContainerName(const std::string& execution_id) {
    return "sandbar_" + execution_id;
}

std::vector<std::string> ContainerRunner::BuildRunArgs(const RunContext& context,
                                                       const std::string& source_path) const {
    const auto& options = context.request.options;
    const auto& sandbox = context.sandbox;
    const auto target = std::string(kMountPoint) + "/main" + sandbox.file_extension;
    const auto nofile = std::to_string(config_.open_files_limit);
    const auto fsize = std::to_string(config_.file_size_limit_bytes);

    std::vector<std::string> args = {
        "run", "--rm",
        "--network", "none",
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=16m",
        "--security-opt", "no-new-privileges:true",
        "--cap-drop", "ALL",
        "--user", "65534:65534",
        "--pids-limit", std::to_string(options.max_processes),
        "--memory", std::to_string(options.memory_ceiling_bytes),
        "--cpus", FormatShare(options.cpu_share),
        "--ulimit", "nofile=" + nofile + ":" + nofile,
        "--ulimit", "fsize=" + fsize + ":" + fsize,
        "--name", ContainerName(context.request.id),
        "-v", source_path + ":" + target + ":ro",
        "-w", kMountPoint,
        "-e", "HOME=/tmp",
        "-e", "PYTHONDONTWRITEBYTECODE=1",
        sandbox.container_image,
    };
    // Images install interpreters under their own prefix; resolve by name on the image PATH.
    args.push_back(std::filesystem::path(sandbox.interpreter).filename().string());
    args.insert(args.end(), sandbox.interpreter_args.begin(), sandbox.interpreter_args.end());
    if (!sandbox.heap_limit_flag.empty()) {
        args.push_back(sandbox.heap_limit_flag + std::to_string(options.memory_ceiling_bytes / (1024 * 1024)));
    }
    args.push_back(target);
    return args;
}

void ContainerRunner::RemoveContainer(const std::string& name) const {
    try {
        bp::child reaper(runtime_path_, "rm", "-f", name,
                         bp::std_in < bp::null, bp::std_out > bp::null, bp::std_err > bp::null);
        reaper.wait();
    } catch (const bp::process_error& ex) {
        utils::LogLine(utils::LogLevel::kWarn, "runner") << "could not remove container " << name << ": "
                                                         << ex.what();
    }
}

sandbox::ExecutionResult ContainerRunner::Run(const RunContext& context) {
    const auto& request = context.request;
    const auto name = ContainerName(request.id);
    std::optional<EphemeralWorkspace> workspace;
    LaunchSpec launch;
    try {
        workspace.emplace(config_.workspace_root, request.id);
        workspace->Create();
        // The container user is nobody; it reads the bind-mounted file only.
        workspace->WriteSource(context.sandbox.file_extension, request.source_code, 0644);
        launch.executable = runtime_path_;
        launch.args = BuildRunArgs(context, std::filesystem::absolute(workspace->SourcePath()).string());
        launch.environment = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}};
        if (const char* home = std::getenv("HOME")) {
            launch.environment["HOME"] = home;
        }
    } catch (const std::exception& ex) {
        utils::LogLine(utils::LogLevel::kError, "runner") << request.id << " setup failed: " << ex.what();
        return sandbox::RunnerFault(std::string("failed to prepare sandbox: ") + ex.what());
    }

    IsolationPlan plan;
    plan.new_session = true;
    plan.no_new_privs = true;

    bool runner_killed = false;
    SupervisionLimits limits;
    limits.timeout = std::chrono::milliseconds(request.options.timeout_ms);
    limits.output_limit_bytes = config_.output_limit_bytes;
    limits.cancel_requested = context.cancel_requested;
    limits.on_kill = [this, &name, &runner_killed] {
        runner_killed = true;
        RemoveContainer(name);
    };

    auto outcome = Supervise(launch, plan, limits);
    RemoveContainer(name);

    if (outcome.launched && !outcome.timed_out && !outcome.cancelled && outcome.exit_code) {
        if (*outcome.exit_code == kRuntimeFailure) {
            return sandbox::RunnerFault("container runtime failed: " + outcome.stderr_text);
        }
        if (*outcome.exit_code == kKilledBySignal9 && !runner_killed) {
            auto result = ClassifyOutcome(std::move(outcome), true);
            result.exit_code.reset();
            return result;
        }
    }
    return ClassifyOutcome(std::move(outcome), false);
}

}  // namespace sandbar::runner
