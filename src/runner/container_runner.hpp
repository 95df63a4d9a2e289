#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runner/runner.hpp"

namespace sandbar::runner {

// Runs each execution in a throwaway container through the configured
// runtime CLI (docker or podman).
class ContainerRunner : public Runner {
public:
    explicit ContainerRunner(config::IsolationConfig config);

    sandbox::ExecutionResult Run(const RunContext& context) override;

    static std::string ContainerName(const std::string& execution_id);
    std::vector<std::string> BuildRunArgs(const RunContext& context, const std::string& source_path) const;

private:
    void RemoveContainer(const std::string& name) const;

    config::IsolationConfig config_;
    std::string runtime_path_;
};

}  // namespace sandbar::runner
