#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "sandbox/sandbox_types.hpp"

namespace sandbar::bus {

enum class ExecutionEventKind {
    kQueued,
    kStarted,
    kCompleted,
    kFailed,
    kTimedOut,
    kCancelled
};

inline const char* ToString(ExecutionEventKind kind) {
    switch (kind) {
        case ExecutionEventKind::kQueued: return "execution_queued";
        case ExecutionEventKind::kStarted: return "execution_started";
        case ExecutionEventKind::kCompleted: return "execution_completed";
        case ExecutionEventKind::kFailed: return "execution_failed";
        case ExecutionEventKind::kTimedOut: return "execution_timed_out";
        case ExecutionEventKind::kCancelled: return "execution_cancelled";
    }
    return "unknown";
}

struct ExecutionEvent {
    ExecutionEventKind kind = ExecutionEventKind::kQueued;
    std::string execution_id;
    sandbox::Language language = sandbox::Language::kPython;
    sandbox::ExecutionState state = sandbox::ExecutionState::kQueued;
    std::size_t queue_position = 0;
    std::optional<sandbox::TerminationReason> termination_reason;
    long long elapsed_ms = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

}  // namespace sandbar::bus
