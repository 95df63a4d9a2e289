#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "bus/event_bus.hpp"
#include "scheduler/execution.hpp"

namespace sandbar::collector {

// Turns raw runner output into the caller-facing result, publishes lifecycle
// events and makes sure no ephemeral artifact outlives its execution.
class ResultCollector {
public:
    ResultCollector(std::filesystem::path workspace_root, std::shared_ptr<bus::EventBus> bus);

    void OnQueued(const scheduler::Execution& execution, std::size_t queue_position);
    void OnStarted(const scheduler::Execution& execution);
    void OnCancelledWhileQueued(const scheduler::Execution& execution);

    sandbox::ExecutionResult Collect(const scheduler::Execution& execution, sandbox::ExecutionResult raw);

    std::filesystem::path ArtifactPath(const std::string& execution_id) const;
    // Idempotent; false if the directory survived every attempt.
    bool RemoveArtifact(const std::string& execution_id);

    std::string SanitizeError(const std::string& message) const;

private:
    void Publish(bus::ExecutionEventKind kind, const scheduler::Execution& execution,
                 sandbox::ExecutionState state, std::size_t queue_position = 0,
                 const sandbox::ExecutionResult* result = nullptr);

    std::filesystem::path workspace_root_;
    std::shared_ptr<bus::EventBus> bus_;
};

}  // namespace sandbar::collector
