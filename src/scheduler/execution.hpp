#pragma once

#include <atomic>
#include <future>
#include <optional>

#include "sandbox/sandbox_types.hpp"

namespace sandbar::scheduler {

// Scheduler-owned lifecycle record of one admitted request. Mutable fields
// are guarded by the scheduler mutex; the flag is polled by the runner.
struct Execution {
    explicit Execution(sandbox::ExecutionRequest req)
        : request(std::move(req)), result_future(result_promise.get_future().share()) {}

    const sandbox::ExecutionRequest request;
    sandbox::ExecutionState state = sandbox::ExecutionState::kQueued;
    long long submitted_at_ms = 0;
    long long started_at_ms = 0;
    long long ended_at_ms = 0;
    int slot = -1;
    std::atomic<bool> cancel_requested{false};
    std::optional<sandbox::ExecutionResult> result;
    std::promise<sandbox::ExecutionResult> result_promise;
    std::shared_future<sandbox::ExecutionResult> result_future;
};

}  // namespace sandbar::scheduler
