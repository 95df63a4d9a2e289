#include "runner/process_runner.hpp"

#include <algorithm>
#include <cmath>
#include <csignal>
#include <fcntl.h>
#include <optional>
#include <sched.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include "runner/cgroup_limiter.hpp"
#include "runner/ephemeral_workspace.hpp"
#include "utils/logging.hpp"

namespace sandbar::runner {
namespace {

constexpr long long kMiB = 1024 * 1024;

rlimit Limit(rlim_t soft, rlim_t hard) {
    rlimit limit{};
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    return limit;
}

// O_PATH handle on the execution directory; the child bind-mounts it through
// /proc/self/fd after the workspace root has been covered.
class DirectoryHandle {
public:
    explicit DirectoryHandle(const std::filesystem::path& path)
        : fd_(::open(path.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC)) {
        if (fd_ < 0) {
            throw std::system_error(errno, std::system_category(), "open execution directory");
        }
    }
    ~DirectoryHandle() { ::close(fd_); }

    DirectoryHandle(const DirectoryHandle&) = delete;
    DirectoryHandle& operator=(const DirectoryHandle&) = delete;

    std::string ProcPath() const { return "/proc/self/fd/" + std::to_string(fd_); }

private:
    int fd_;
};

}  // namespace

ProcessRunner::ProcessRunner(config::IsolationConfig config)
    : config_(std::move(config)),
      privileged_(::geteuid() == 0),
      locked_root_flags_(LockedRootFlags()) {
    config_.workspace_root = std::filesystem::absolute(config_.workspace_root).lexically_normal().string();
}

IsolationPlan ProcessRunner::BuildPlan(const RunContext& context,
                                       const std::filesystem::path& execution_dir) const {
    const auto& options = context.request.options;
    IsolationPlan plan;
    plan.new_session = true;
    if (config_.unshare_network) {
        plan.clone_flags |= CLONE_NEWNET;
    }
    if (config_.private_mounts) {
        plan.clone_flags |= CLONE_NEWNS;
        plan.private_mounts = true;
        plan.readonly_root = true;
        plan.root_remount_flags = locked_root_flags_;
        plan.workspace_root = config_.workspace_root;
        plan.execution_dir = execution_dir.string();
    }
    if (plan.clone_flags != 0 && !privileged_) {
        plan.clone_flags |= CLONE_NEWUSER;
        plan.map_identity = true;
        plan.uid_map = std::to_string(::getuid()) + " " + std::to_string(::getuid()) + " 1\n";
        plan.gid_map = std::to_string(::getgid()) + " " + std::to_string(::getgid()) + " 1\n";
    }

    if (context.sandbox.limit_address_space) {
        const auto bytes = static_cast<rlim_t>(options.memory_ceiling_bytes);
        plan.rlimits.emplace_back(RLIMIT_AS, Limit(bytes, bytes));
    } else {
        // Reservations stay outside RLIMIT_DATA until they become writable, so
        // Buffers and other off-heap memory are still bounded.
        const auto bytes = static_cast<rlim_t>(options.memory_ceiling_bytes + context.sandbox.data_limit_allowance_bytes);
        plan.rlimits.emplace_back(RLIMIT_DATA, Limit(bytes, bytes));
    }
    // The share of one core over the wall-clock budget, as CPU seconds.
    const auto cpu_budget_ms = std::ceil(static_cast<double>(options.timeout_ms) * options.cpu_share);
    const auto cpu_seconds = static_cast<rlim_t>(std::max(1.0, std::ceil(cpu_budget_ms / 1000.0)));
    plan.rlimits.emplace_back(RLIMIT_CPU, Limit(cpu_seconds, cpu_seconds + 1));
    const auto file_size = static_cast<rlim_t>(config_.file_size_limit_bytes);
    plan.rlimits.emplace_back(RLIMIT_FSIZE, Limit(file_size, file_size));
    const auto processes = static_cast<rlim_t>(options.max_processes);
    plan.rlimits.emplace_back(RLIMIT_NPROC, Limit(processes, processes));
    const auto open_files = static_cast<rlim_t>(config_.open_files_limit);
    plan.rlimits.emplace_back(RLIMIT_NOFILE, Limit(open_files, open_files));
    plan.rlimits.emplace_back(RLIMIT_CORE, Limit(0, 0));
    plan.niceness = config_.niceness;

    if (SwitchesIdentity()) {
        plan.drop_capabilities = true;
        plan.switch_identity = true;
        plan.uid = static_cast<uid_t>(config_.sandbox_uid_base + context.slot);
        plan.gid = static_cast<gid_t>(config_.sandbox_uid_base + context.slot);
    }
    plan.no_new_privs = true;
    plan.working_dir = execution_dir.string();
    return plan;
}

LaunchSpec ProcessRunner::BuildLaunch(const RunContext& context, const std::filesystem::path& source_path) const {
    const auto dir = source_path.parent_path().string();
    LaunchSpec spec;
    spec.executable = context.sandbox.interpreter;
    spec.args = context.sandbox.interpreter_args;
    if (!context.sandbox.heap_limit_flag.empty()) {
        const auto mib = std::max<long long>(context.request.options.memory_ceiling_bytes / kMiB, 16);
        spec.args.push_back(context.sandbox.heap_limit_flag + std::to_string(mib));
    }
    spec.args.push_back(source_path.string());
    spec.environment = {
        {"PATH", "/usr/bin:/bin"},
        {"HOME", dir},
        {"TMPDIR", dir},
        {"LANG", "C.UTF-8"},
        {"TERM", "dumb"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"SHELL", "/bin/false"},
        {"USER", "sandbox"},
    };
    return spec;
}

sandbox::ExecutionResult ProcessRunner::Run(const RunContext& context) {
    const auto& request = context.request;
    std::optional<EphemeralWorkspace> workspace;
    std::optional<CgroupLimiter> cgroup;
    std::optional<DirectoryHandle> dir_handle;
    IsolationPlan plan;
    LaunchSpec launch;
    try {
        workspace.emplace(config_.workspace_root, request.id);
        workspace->Create();
        workspace->WriteSource(context.sandbox.file_extension, request.source_code, 0600);
        if (SwitchesIdentity()) {
            workspace->GrantTo(static_cast<uid_t>(config_.sandbox_uid_base + context.slot),
                              static_cast<gid_t>(config_.sandbox_uid_base + context.slot));
        }
        plan = BuildPlan(context, workspace->Directory());
        if (plan.private_mounts) {
            dir_handle.emplace(workspace->Directory());
            plan.execution_dir_fd_path = dir_handle->ProcPath();
        }
        if (!config_.cgroup_root.empty()) {
            cgroup.emplace(config_.cgroup_root, request.id);
            cgroup->Create(request.options);
            plan.cgroup_procs_path = cgroup->ProcsPath();
        }
        launch = BuildLaunch(context, workspace->SourcePath());
    } catch (const std::exception& ex) {
        utils::LogLine(utils::LogLevel::kError, "runner") << request.id << " setup failed: " << ex.what();
        return sandbox::RunnerFault(std::string("failed to prepare sandbox: ") + ex.what());
    }

    SupervisionLimits limits;
    limits.timeout = std::chrono::milliseconds(request.options.timeout_ms);
    limits.output_limit_bytes = config_.output_limit_bytes;
    limits.cancel_requested = context.cancel_requested;
    if (cgroup) {
        limits.on_kill = [&cgroup] { cgroup->KillAll(); };
    }

    utils::LogLine(utils::LogLevel::kDebug, "runner") << request.id << " launching " << launch.executable
                                                      << " in slot " << context.slot;
    auto outcome = Supervise(launch, plan, limits);
    if (cgroup) {
        // Anything that escaped the process group still lives in the cgroup.
        cgroup->KillAll();
    }
    const bool oom_killed = cgroup && cgroup->OomKilled();
    return ClassifyOutcome(std::move(outcome), oom_killed);
}

sandbox::ExecutionResult ClassifyOutcome(ProcessOutcome outcome, bool oom_killed) {
    using sandbox::TerminationReason;
    if (!outcome.launched) {
        return sandbox::RunnerFault("failed to launch sandbox: " + outcome.launch_error);
    }
    sandbox::ExecutionResult result{};
    result.stdout_text = std::move(outcome.stdout_text);
    result.stderr_text = std::move(outcome.stderr_text);
    result.output_truncated = outcome.output_truncated;
    result.elapsed_ms = outcome.elapsed_ms;

    if (outcome.timed_out) {
        result.termination_reason = TerminationReason::kTimeout;
        return result;
    }
    if (outcome.cancelled) {
        result.termination_reason = TerminationReason::kCancelled;
        result.error = "cancelled by caller";
        return result;
    }
    if (outcome.term_signal) {
        const int sig = *outcome.term_signal;
        // A SIGKILL the supervisor did not send comes from the kernel (OOM, pids).
        if (sig == SIGXCPU || sig == SIGXFSZ || sig == SIGKILL || oom_killed) {
            result.termination_reason = TerminationReason::kResourceLimit;
        }
        return result;
    }
    result.exit_code = outcome.exit_code;
    if (oom_killed) {
        result.termination_reason = TerminationReason::kResourceLimit;
    }
    return result;
}

}  // namespace sandbar::runner
