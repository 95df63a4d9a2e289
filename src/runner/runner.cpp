#include "runner/runner.hpp"

#include "runner/container_runner.hpp"
#include "runner/process_runner.hpp"
#include "utils/logging.hpp"

namespace sandbar::runner {

std::unique_ptr<Runner> CreateRunner(const config::IsolationConfig& config) {
    if (config.mode == "container") {
        utils::LogLine(utils::LogLevel::kInfo, "runner") << "using container backend (" << config.container_runtime
                                                         << ")";
        return std::make_unique<ContainerRunner>(config);
    }
    if (config.mode != "process") {
        utils::LogLine(utils::LogLevel::kWarn, "runner") << "unknown isolation mode '" << config.mode
                                                         << "', using process";
    }
    return std::make_unique<ProcessRunner>(config);
}

}  // namespace sandbar::runner
