#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "runner/isolation_policy.hpp"
#include "runner/runner.hpp"
#include "runner/supervised_process.hpp"

namespace sandbar::runner {

// Native backend: the interpreter runs as a direct child inside Linux
// namespaces, rlimits and an optional cgroup.
class ProcessRunner : public Runner {
public:
    explicit ProcessRunner(config::IsolationConfig config);

    sandbox::ExecutionResult Run(const RunContext& context) override;

    IsolationPlan BuildPlan(const RunContext& context, const std::filesystem::path& execution_dir) const;
    LaunchSpec BuildLaunch(const RunContext& context, const std::filesystem::path& source_path) const;

private:
    bool SwitchesIdentity() const { return privileged_ && config_.drop_privileges; }

    config::IsolationConfig config_;
    bool privileged_ = false;
    unsigned long locked_root_flags_ = 0;
};

sandbox::ExecutionResult ClassifyOutcome(ProcessOutcome outcome, bool oom_killed);

}  // namespace sandbar::runner
