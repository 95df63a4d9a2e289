#pragma once

#include <atomic>
#include <memory>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "sandbox/sandbox_types.hpp"

namespace sandbar::runner {

struct RunContext {
    const sandbox::ExecutionRequest& request;
    const sandbox::SandboxDescriptor& sandbox;
    // Worker slot executing the request; selects the sandbox identity.
    int slot = 0;
    const std::atomic<bool>* cancel_requested = nullptr;
};

class Runner {
public:
    virtual ~Runner() = default;
    // Always returns a terminal result; launch problems become kRunnerError.
    virtual sandbox::ExecutionResult Run(const RunContext& context) = 0;
};

// Selects the backend named by isolation.mode ("process" or "container").
std::unique_ptr<Runner> CreateRunner(const config::IsolationConfig& config);

}  // namespace sandbar::runner
