#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "bus/event_bus.hpp"
#include "collector/result_collector.hpp"
#include "scheduler/scheduler.hpp"
#include "test_support.hpp"

using sandbar::sandbox::ExecutionState;
using sandbar::sandbox::TerminationReason;
using sandbar::scheduler::AdmissionStatus;
using sandbar::scheduler::Scheduler;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

class SchedulerTest : public ::testing::Test {
protected:
    void Build(int max_concurrent, int max_queue_depth, long long retention_ms = 60000,
               std::shared_ptr<const sandbar::sandbox::SandboxRegistry> registry = nullptr) {
        sandbar::config::SchedulerConfig config;
        config.max_concurrent = max_concurrent;
        config.max_queue_depth = max_queue_depth;
        config.result_retention_ms = retention_ms;
        auto runner = std::make_unique<sandbar::test::GatedRunner>();
        runner_ = runner.get();
        bus_ = std::make_shared<sandbar::bus::EventBus>();
        auto collector = std::make_shared<sandbar::collector::ResultCollector>(workspace_.Path(), bus_);
        scheduler_ = std::make_unique<Scheduler>(
            config, registry ? registry : sandbar::sandbox::SandboxRegistry::BuiltIn(), std::move(runner), collector);
        scheduler_->Start();
    }

    void TearDown() override {
        if (runner_) {
            runner_->ReleaseAll();
        }
        scheduler_.reset();
    }

    sandbar::test::TempDir workspace_;
    sandbar::test::GatedRunner* runner_ = nullptr;
    std::shared_ptr<sandbar::bus::EventBus> bus_;
    std::unique_ptr<Scheduler> scheduler_;
};

}  // namespace

// NOLINTNEXTLINE
TEST_F(SchedulerTest, starts_in_submission_order) {
    Build(1, 8);
    for (const char* id : {"a", "b", "c"}) {
        ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest(id)).status, AdmissionStatus::kAdmitted);
    }
    ASSERT_TRUE(runner_->WaitForStarted(1));
    runner_->Release("a");
    ASSERT_TRUE(runner_->WaitForStarted(2));
    runner_->Release("b");
    ASSERT_TRUE(runner_->WaitForStarted(3));
    runner_->Release("c");

    const auto result = scheduler_->Wait("c", kWait);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_text, "ran c");
    EXPECT_EQ(runner_->Started(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(scheduler_->StatusOf("a"), ExecutionState::kCompleted);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, never_exceeds_slot_count) {
    Build(2, 8);
    for (const char* id : {"a", "b", "c", "d", "e"}) {
        ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest(id)).status, AdmissionStatus::kAdmitted);
    }
    ASSERT_TRUE(runner_->WaitForStarted(2));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(runner_->Started().size(), 2u);

    const auto status = scheduler_->Status();
    EXPECT_EQ(status.running, 2u);
    EXPECT_EQ(status.queued, 3u);
    EXPECT_EQ(status.max_concurrent, 2);

    runner_->ReleaseAll();
    ASSERT_TRUE(scheduler_->Wait("e", kWait).has_value());
    ASSERT_TRUE(scheduler_->Wait("a", kWait).has_value());
    EXPECT_EQ(runner_->Peak(), 2);
    for (const int slot : runner_->Slots()) {
        EXPECT_TRUE(slot == 0 || slot == 1);
    }
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, rejects_when_queue_is_full) {
    Build(1, 2);
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(runner_->WaitForStarted(1));

    auto admission = scheduler_->Submit(sandbar::test::MakeRequest("b"));
    EXPECT_EQ(admission.status, AdmissionStatus::kAdmitted);
    EXPECT_EQ(admission.queue_position, 1u);
    admission = scheduler_->Submit(sandbar::test::MakeRequest("c"));
    EXPECT_EQ(admission.status, AdmissionStatus::kAdmitted);
    EXPECT_EQ(admission.queue_position, 2u);

    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("d")).status, AdmissionStatus::kSaturated);
    EXPECT_FALSE(scheduler_->StatusOf("d").has_value());

    const auto snapshot = scheduler_->Snapshot("c");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->state, ExecutionState::kQueued);
    EXPECT_EQ(snapshot->queue_position, 2u);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, depth_counts_only_waiters) {
    Build(3, 1);
    for (const char* id : {"a", "b", "c"}) {
        const auto admission = scheduler_->Submit(sandbar::test::MakeRequest(id));
        ASSERT_EQ(admission.status, AdmissionStatus::kAdmitted) << id;
        EXPECT_EQ(admission.queue_position, 0u);
    }
    ASSERT_TRUE(runner_->WaitForStarted(3));

    const auto waiting = scheduler_->Submit(sandbar::test::MakeRequest("d"));
    ASSERT_EQ(waiting.status, AdmissionStatus::kAdmitted);
    EXPECT_EQ(waiting.queue_position, 1u);
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("e")).status, AdmissionStatus::kSaturated);

    runner_->Release("a");
    ASSERT_TRUE(runner_->WaitForStarted(4));
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("e")).status, AdmissionStatus::kAdmitted);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, zero_depth_still_fills_free_slots) {
    Build(2, 0);
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("b")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(runner_->WaitForStarted(2));
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("c")).status, AdmissionStatus::kSaturated);
    EXPECT_EQ(scheduler_->Status().running, 2u);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, duplicate_live_ids_are_refused) {
    Build(1, 4);
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kDuplicate);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, cancelling_a_queued_execution_skips_it) {
    Build(1, 4);
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(runner_->WaitForStarted(1));
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("b")).status, AdmissionStatus::kAdmitted);
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("c")).status, AdmissionStatus::kAdmitted);

    EXPECT_TRUE(scheduler_->Cancel("b"));
    EXPECT_EQ(scheduler_->StatusOf("b"), ExecutionState::kCancelled);
    EXPECT_EQ(scheduler_->Snapshot("c")->queue_position, 1u);

    const auto cancelled = scheduler_->Wait("b", kWait);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->termination_reason, TerminationReason::kCancelled);
    EXPECT_FALSE(cancelled->exit_code.has_value());

    runner_->ReleaseAll();
    ASSERT_TRUE(scheduler_->Wait("c", kWait).has_value());
    EXPECT_EQ(runner_->Started(), (std::vector<std::string>{"a", "c"}));
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, cancelling_a_running_execution_signals_the_runner) {
    Build(1, 4);
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(runner_->WaitForStarted(1));

    EXPECT_TRUE(scheduler_->Cancel("a"));
    const auto result = scheduler_->Wait("a", kWait);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination_reason, TerminationReason::kCancelled);
    EXPECT_EQ(scheduler_->StatusOf("a"), ExecutionState::kCancelled);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, terminal_states_are_final) {
    Build(1, 4);
    runner_->ReleaseAll();
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    const auto result = scheduler_->Wait("a", kWait);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination_reason, TerminationReason::kNormal);
    EXPECT_EQ(result->exit_code, 0);

    EXPECT_FALSE(scheduler_->Cancel("a"));
    EXPECT_EQ(scheduler_->StatusOf("a"), ExecutionState::kCompleted);
    EXPECT_FALSE(scheduler_->Cancel("unknown"));

    // A finished id may be reused.
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, runner_exceptions_become_failures) {
    Build(1, 4);
    runner_->ReleaseAll();
    runner_->SetResult([](const sandbar::runner::RunContext&) -> sandbar::sandbox::ExecutionResult {
        throw std::runtime_error("boom");
    });
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    const auto result = scheduler_->Wait("a", kWait);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination_reason, TerminationReason::kRunnerError);
    EXPECT_NE(result->error.find("boom"), std::string::npos);
    EXPECT_TRUE(result->stdout_text.empty());
    EXPECT_EQ(scheduler_->StatusOf("a"), ExecutionState::kFailed);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, unsupported_language_fails_without_running) {
    Build(1, 4, 60000,
          std::make_shared<const sandbar::sandbox::SandboxRegistry>(std::vector<sandbar::sandbox::SandboxDescriptor>{}));
    runner_->ReleaseAll();
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    const auto result = scheduler_->Wait("a", kWait);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination_reason, TerminationReason::kRunnerError);
    EXPECT_TRUE(runner_->Started().empty());
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, resource_limits_are_reported_as_timed_out) {
    Build(1, 4);
    runner_->ReleaseAll();
    runner_->SetResult([](const sandbar::runner::RunContext&) {
        sandbar::sandbox::ExecutionResult result{};
        result.termination_reason = TerminationReason::kResourceLimit;
        result.elapsed_ms = 3;
        return result;
    });
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    const auto result = scheduler_->Wait("a", kWait);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination_reason, TerminationReason::kResourceLimit);
    EXPECT_EQ(scheduler_->StatusOf("a"), ExecutionState::kTimedOut);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, finished_results_expire_after_retention) {
    Build(1, 4, 50);
    runner_->ReleaseAll();
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(scheduler_->Wait("a", kWait).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_FALSE(scheduler_->StatusOf("a").has_value());
    EXPECT_EQ(scheduler_->Status().retained, 0u);
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, stop_cancels_outstanding_work) {
    Build(1, 4);
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(runner_->WaitForStarted(1));
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("b")).status, AdmissionStatus::kAdmitted);

    scheduler_->Stop();
    EXPECT_EQ(scheduler_->StatusOf("a"), ExecutionState::kCancelled);
    EXPECT_EQ(scheduler_->StatusOf("b"), ExecutionState::kCancelled);
    EXPECT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("c")).status, AdmissionStatus::kStopped);
    EXPECT_EQ(runner_->Started(), (std::vector<std::string>{"a"}));
}

// NOLINTNEXTLINE
TEST_F(SchedulerTest, publishes_lifecycle_events_in_order) {
    Build(1, 4);
    runner_->ReleaseAll();
    ASSERT_EQ(scheduler_->Submit(sandbar::test::MakeRequest("a")).status, AdmissionStatus::kAdmitted);
    ASSERT_TRUE(scheduler_->Wait("a", kWait).has_value());

    std::vector<sandbar::bus::ExecutionEventKind> kinds;
    sandbar::bus::ExecutionEvent event;
    while (bus_->TryConsume(event, std::chrono::milliseconds(100))) {
        EXPECT_EQ(event.execution_id, "a");
        kinds.push_back(event.kind);
    }
    EXPECT_EQ(kinds, (std::vector<sandbar::bus::ExecutionEventKind>{
                         sandbar::bus::ExecutionEventKind::kQueued,
                         sandbar::bus::ExecutionEventKind::kStarted,
                         sandbar::bus::ExecutionEventKind::kCompleted}));
}

// NOLINTNEXTLINE
TEST(scheduler, needs_all_collaborators) {
    EXPECT_THROW(Scheduler(sandbar::config::SchedulerConfig{}, sandbar::sandbox::SandboxRegistry::BuiltIn(),
                           nullptr, nullptr),
                 std::invalid_argument);
}
