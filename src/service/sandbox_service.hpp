#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bus/event_bus.hpp"
#include "collector/result_collector.hpp"
#include "config/config_schema.hpp"
#include "runner/runner.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "scheduler/scheduler.hpp"
#include "validator/static_validator.hpp"

namespace sandbar::service {

enum class SubmitStatus {
    kAccepted,
    kRejected,
    kSaturated,
    kInvalid
};

const char* ToString(SubmitStatus status);

struct SubmitRequest {
    std::string source_code;
    std::string language;
    sandbox::RequestedOptions options;
};

struct SubmitResponse {
    SubmitStatus status = SubmitStatus::kInvalid;
    std::string execution_id;
    std::size_t queue_position = 0;
    sandbox::ExecutionOptions options;
    std::vector<validator::Violation> violations;
    std::string message;
};

struct PollResponse {
    bool found = false;
    std::string execution_id;
    sandbox::ExecutionState state = sandbox::ExecutionState::kQueued;
    std::size_t queue_position = 0;
    std::optional<sandbox::ExecutionResult> result;
};

// The single admission path: every transport goes through Submit, which
// validates before anything is queued.
class SandboxService {
public:
    explicit SandboxService(const config::Config& config);
    SandboxService(const config::Config& config,
                   std::shared_ptr<const sandbox::SandboxRegistry> registry,
                   std::unique_ptr<runner::Runner> runner);
    ~SandboxService();

    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    void Start();
    void Stop();

    SubmitResponse Submit(const SubmitRequest& request);
    PollResponse Poll(const std::string& execution_id);
    bool Cancel(const std::string& execution_id);
    std::optional<sandbox::ExecutionResult> Wait(const std::string& execution_id,
                                                 std::chrono::milliseconds timeout);
    scheduler::Scheduler::QueueStatus QueueStatus();

    const sandbox::SandboxRegistry& Registry() const { return *registry_; }
    const validator::StaticValidator& Validator() const { return validator_; }
    bus::EventBus& Events() { return *bus_; }
    std::filesystem::path ArtifactPath(const std::string& execution_id) const;

private:
    std::shared_ptr<const sandbox::SandboxRegistry> registry_;
    validator::StaticValidator validator_;
    std::shared_ptr<bus::EventBus> bus_;
    std::shared_ptr<collector::ResultCollector> collector_;
    scheduler::Scheduler scheduler_;
    std::thread dispatcher_;
    bool started_ = false;
};

}  // namespace sandbar::service
