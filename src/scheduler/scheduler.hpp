#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "collector/result_collector.hpp"
#include "config/config_schema.hpp"
#include "runner/runner.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "scheduler/execution.hpp"

namespace sandbar::scheduler {

enum class AdmissionStatus {
    kAdmitted,
    kSaturated,
    kDuplicate,
    kStopped
};

const char* ToString(AdmissionStatus status);

struct Admission {
    AdmissionStatus status = AdmissionStatus::kAdmitted;
    // Only executions waiting for a busy slot count; 0 means a free slot takes it next.
    std::size_t queue_position = 0;
    std::shared_future<sandbox::ExecutionResult> result;
};

// Point-in-time copy of an execution, safe to hand to other threads.
struct ExecutionSnapshot {
    std::string id;
    sandbox::Language language = sandbox::Language::kPython;
    sandbox::ExecutionOptions options;
    sandbox::ExecutionState state = sandbox::ExecutionState::kQueued;
    std::size_t queue_position = 0;
    long long submitted_at_ms = 0;
    long long started_at_ms = 0;
    long long ended_at_ms = 0;
    std::optional<sandbox::ExecutionResult> result;
};

// Bounded FIFO admission queue in front of a fixed number of runner slots.
class Scheduler {
public:
    struct QueueStatus {
        std::size_t queued = 0;
        std::size_t running = 0;
        std::size_t retained = 0;
        int max_concurrent = 0;
        int max_queue_depth = 0;
    };

    Scheduler(config::SchedulerConfig config,
              std::shared_ptr<const sandbox::SandboxRegistry> registry,
              std::unique_ptr<runner::Runner> runner,
              std::shared_ptr<collector::ResultCollector> collector);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();
    // Cancels queued work, signals running work and joins the workers.
    void Stop();

    Admission Submit(sandbox::ExecutionRequest request);
    std::optional<sandbox::ExecutionState> StatusOf(const std::string& id);
    std::optional<ExecutionSnapshot> Snapshot(const std::string& id);
    bool Cancel(const std::string& id);
    // Empty when the id is unknown or the execution is not terminal in time.
    std::optional<sandbox::ExecutionResult> Wait(const std::string& id, std::chrono::milliseconds timeout);
    QueueStatus Status();

private:
    using ExecutionPtr = std::shared_ptr<Execution>;

    void WorkerLoop(int slot);
    void RunExecution(const ExecutionPtr& execution, int slot);
    // Requires mutex_. Refuses transitions the state machine does not allow.
    bool Transition(Execution& execution, sandbox::ExecutionState next);
    void Finish(const ExecutionPtr& execution, sandbox::ExecutionResult result);
    // Requires mutex_. Workers that are free to take the next queued execution.
    std::size_t IdleSlots() const;
    // Requires mutex_. Waiters ahead of `id` beyond the idle slots, itself
    // included; 0 when a free slot is about to pick it up.
    std::size_t PositionOf(const std::string& id) const;
    void EvictExpired();

    config::SchedulerConfig config_;
    std::shared_ptr<const sandbox::SandboxRegistry> registry_;
    std::unique_ptr<runner::Runner> runner_;
    std::shared_ptr<collector::ResultCollector> collector_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ExecutionPtr> queue_;
    std::map<std::string, ExecutionPtr> executions_;
    std::size_t running_count_ = 0;
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
};

}  // namespace sandbar::scheduler
