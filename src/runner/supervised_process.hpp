#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "runner/isolation_policy.hpp"

namespace sandbar::runner {

struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;
};

struct SupervisionLimits {
    std::chrono::milliseconds timeout{0};
    std::size_t output_limit_bytes = 0;
    const std::atomic<bool>* cancel_requested = nullptr;
    // Extra teardown run once when the supervisor kills the process group.
    std::function<void()> on_kill;
};

struct ProcessOutcome {
    bool launched = false;
    std::string launch_error;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;
    long long elapsed_ms = 0;
};

// Spawns the process inside `plan`, streams stdout and stderr into capped
// buffers, and kills the whole process group on deadline or cancellation.
// Returns once the process has been reaped and both pipes are drained.
ProcessOutcome Supervise(const LaunchSpec& spec, const IsolationPlan& plan, const SupervisionLimits& limits);

}  // namespace sandbar::runner
