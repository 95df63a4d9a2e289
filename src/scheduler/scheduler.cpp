#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandbar::scheduler {

const char* ToString(AdmissionStatus status) {
    switch (status) {
        case AdmissionStatus::kAdmitted: return "admitted";
        case AdmissionStatus::kSaturated: return "saturated";
        case AdmissionStatus::kDuplicate: return "duplicate";
        case AdmissionStatus::kStopped: return "stopped";
    }
    return "unknown";
}

Scheduler::Scheduler(config::SchedulerConfig config,
                     std::shared_ptr<const sandbox::SandboxRegistry> registry,
                     std::unique_ptr<runner::Runner> runner,
                     std::shared_ptr<collector::ResultCollector> collector)
    : config_(std::move(config))
    , registry_(std::move(registry))
    , runner_(std::move(runner))
    , collector_(std::move(collector)) {
    if (!registry_ || !runner_ || !collector_) {
        throw std::invalid_argument("scheduler needs a registry, a runner and a collector");
    }
    config_.max_concurrent = std::max(1, config_.max_concurrent);
    config_.max_queue_depth = std::max(0, config_.max_queue_depth);
}

Scheduler::~Scheduler() {
    Stop();
}

void Scheduler::Start() {
    if (running_.exchange(true)) {
        return;
    }
    for (int slot = 0; slot < config_.max_concurrent; ++slot) {
        workers_.emplace_back([this, slot]() { WorkerLoop(slot); });
    }
    utils::LogLine(utils::LogLevel::kInfo, "scheduler") << "started " << config_.max_concurrent
                                                        << " slots, queue depth " << config_.max_queue_depth;
}

void Scheduler::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    std::vector<ExecutionPtr> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& execution : queue_) {
            if (Transition(*execution, sandbox::ExecutionState::kCancelled)) {
                execution->ended_at_ms = utils::NowMs();
                execution->result = sandbox::CancelledResult();
                dropped.push_back(execution);
            }
        }
        queue_.clear();
        for (auto& [id, execution] : executions_) {
            if (execution->state == sandbox::ExecutionState::kRunning) {
                execution->cancel_requested = true;
            }
        }
    }
    cv_.notify_all();
    for (auto& execution : dropped) {
        collector_->OnCancelledWhileQueued(*execution);
        execution->result_promise.set_value(*execution->result);
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    utils::LogLine(utils::LogLevel::kInfo, "scheduler") << "stopped, " << dropped.size()
                                                        << " queued executions cancelled";
}

Admission Scheduler::Submit(sandbox::ExecutionRequest request) {
    Admission admission;
    ExecutionPtr execution;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        EvictExpired();
        if (!running_) {
            admission.status = AdmissionStatus::kStopped;
            return admission;
        }
        const auto existing = executions_.find(request.id);
        if (existing != executions_.end() && !sandbox::IsTerminal(existing->second->state)) {
            admission.status = AdmissionStatus::kDuplicate;
            return admission;
        }
        if (queue_.size() >= static_cast<std::size_t>(config_.max_queue_depth) + IdleSlots()) {
            admission.status = AdmissionStatus::kSaturated;
            return admission;
        }
        execution = std::make_shared<Execution>(std::move(request));
        execution->submitted_at_ms = utils::NowMs();
        queue_.push_back(execution);
        executions_[execution->request.id] = execution;
        admission.queue_position = PositionOf(execution->request.id);
        admission.result = execution->result_future;
        collector_->OnQueued(*execution, admission.queue_position);
    }
    cv_.notify_one();
    utils::LogLine(utils::LogLevel::kDebug, "scheduler") << "queued " << execution->request.id
                                                         << " at position " << admission.queue_position;
    return admission;
}

std::optional<sandbox::ExecutionState> Scheduler::StatusOf(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    EvictExpired();
    const auto it = executions_.find(id);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    return it->second->state;
}

std::optional<ExecutionSnapshot> Scheduler::Snapshot(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    EvictExpired();
    const auto it = executions_.find(id);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    const auto& execution = *it->second;
    ExecutionSnapshot snapshot;
    snapshot.id = execution.request.id;
    snapshot.language = execution.request.language;
    snapshot.options = execution.request.options;
    snapshot.state = execution.state;
    snapshot.queue_position = execution.state == sandbox::ExecutionState::kQueued ? PositionOf(id) : 0;
    snapshot.submitted_at_ms = execution.submitted_at_ms;
    snapshot.started_at_ms = execution.started_at_ms;
    snapshot.ended_at_ms = execution.ended_at_ms;
    snapshot.result = execution.result;
    return snapshot;
}

bool Scheduler::Cancel(const std::string& id) {
    ExecutionPtr cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        EvictExpired();
        const auto it = executions_.find(id);
        if (it == executions_.end()) {
            return false;
        }
        auto& execution = it->second;
        if (execution->state == sandbox::ExecutionState::kRunning) {
            execution->cancel_requested = true;
            utils::LogLine(utils::LogLevel::kInfo, "scheduler") << "cancellation requested for running " << id;
            return true;
        }
        if (!Transition(*execution, sandbox::ExecutionState::kCancelled)) {
            return false;
        }
        queue_.erase(std::remove(queue_.begin(), queue_.end(), execution), queue_.end());
        execution->ended_at_ms = utils::NowMs();
        execution->result = sandbox::CancelledResult();
        cancelled = execution;
    }
    collector_->OnCancelledWhileQueued(*cancelled);
    cancelled->result_promise.set_value(*cancelled->result);
    utils::LogLine(utils::LogLevel::kInfo, "scheduler") << "cancelled queued " << id;
    return true;
}

std::optional<sandbox::ExecutionResult> Scheduler::Wait(const std::string& id, std::chrono::milliseconds timeout) {
    std::shared_future<sandbox::ExecutionResult> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = executions_.find(id);
        if (it == executions_.end()) {
            return std::nullopt;
        }
        future = it->second->result_future;
    }
    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

Scheduler::QueueStatus Scheduler::Status() {
    std::lock_guard<std::mutex> lock(mutex_);
    EvictExpired();
    QueueStatus status;
    status.queued = queue_.size();
    status.running = running_count_;
    status.retained = executions_.size() - queue_.size() - running_count_;
    status.max_concurrent = config_.max_concurrent;
    status.max_queue_depth = config_.max_queue_depth;
    return status;
}

void Scheduler::WorkerLoop(int slot) {
    while (true) {
        ExecutionPtr execution;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (!running_) {
                return;
            }
            execution = queue_.front();
            queue_.pop_front();
            Transition(*execution, sandbox::ExecutionState::kRunning);
            execution->started_at_ms = utils::NowMs();
            execution->slot = slot;
            ++running_count_;
        }
        collector_->OnStarted(*execution);
        RunExecution(execution, slot);
    }
}

void Scheduler::RunExecution(const ExecutionPtr& execution, int slot) {
    const auto& request = execution->request;
    sandbox::ExecutionResult raw;
    try {
        const auto& descriptor = registry_->Get(request.language);
        if (execution->cancel_requested) {
            raw = sandbox::CancelledResult();
        } else {
            runner::RunContext context{request, descriptor, slot, &execution->cancel_requested};
            raw = runner_->Run(context);
        }
    } catch (const std::exception& ex) {
        utils::LogLine(utils::LogLevel::kError, "scheduler") << request.id << " runner failed: " << ex.what();
        raw = sandbox::RunnerFault(std::string("runner failed: ") + ex.what());
    }
    Finish(execution, collector_->Collect(*execution, std::move(raw)));
}

void Scheduler::Finish(const ExecutionPtr& execution, sandbox::ExecutionResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_count_;
        if (!Transition(*execution, sandbox::StateFor(result.termination_reason))) {
            // Running can always reach a terminal state; keep the record consistent anyway.
            execution->state = sandbox::ExecutionState::kFailed;
        }
        execution->ended_at_ms = utils::NowMs();
        execution->result = result;
    }
    utils::LogLine(utils::LogLevel::kInfo, "scheduler")
        << execution->request.id << " " << sandbox::ToString(execution->state) << " ("
        << sandbox::ToString(result.termination_reason) << ", " << result.elapsed_ms << " ms)";
    execution->result_promise.set_value(std::move(result));
}

bool Scheduler::Transition(Execution& execution, sandbox::ExecutionState next) {
    if (!sandbox::IsAllowedTransition(execution.state, next)) {
        utils::LogLine(utils::LogLevel::kWarn, "scheduler")
            << "refused transition " << sandbox::ToString(execution.state) << " -> " << sandbox::ToString(next)
            << " for " << execution.request.id;
        return false;
    }
    execution.state = next;
    return true;
}

std::size_t Scheduler::IdleSlots() const {
    const auto slots = static_cast<std::size_t>(config_.max_concurrent);
    return running_count_ < slots ? slots - running_count_ : 0;
}

std::size_t Scheduler::PositionOf(const std::string& id) const {
    const auto idle = IdleSlots();
    for (std::size_t i = 0; i < queue_.size(); ++i) {
        if (queue_[i]->request.id == id) {
            return i < idle ? 0 : i + 1 - idle;
        }
    }
    return 0;
}

void Scheduler::EvictExpired() {
    const auto now = utils::NowMs();
    for (auto it = executions_.begin(); it != executions_.end();) {
        const auto& execution = *it->second;
        if (sandbox::IsTerminal(execution.state) && now - execution.ended_at_ms >= config_.result_retention_ms) {
            it = executions_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace sandbar::scheduler
