#include "sandbox/sandbox_types.hpp"

#include "utils/common.hpp"

namespace sandbar::sandbox {

const char* ToString(Language language) {
    switch (language) {
        case Language::kPython: return "python";
        case Language::kJavaScript: return "javascript";
        case Language::kShell: return "shell";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(std::string_view name) {
    const auto lowered = utils::ToLower(utils::Trim(name));
    if (lowered == "python" || lowered == "py" || lowered == "python3") {
        return Language::kPython;
    }
    if (lowered == "javascript" || lowered == "js" || lowered == "node") {
        return Language::kJavaScript;
    }
    if (lowered == "shell" || lowered == "bash" || lowered == "sh") {
        return Language::kShell;
    }
    return std::nullopt;
}

const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kQueued: return "queued";
        case ExecutionState::kRunning: return "running";
        case ExecutionState::kCompleted: return "completed";
        case ExecutionState::kFailed: return "failed";
        case ExecutionState::kTimedOut: return "timed_out";
        case ExecutionState::kCancelled: return "cancelled";
    }
    return "unknown";
}

bool IsTerminal(ExecutionState state) {
    return state != ExecutionState::kQueued && state != ExecutionState::kRunning;
}

bool IsAllowedTransition(ExecutionState from, ExecutionState to) {
    switch (from) {
        case ExecutionState::kQueued:
            return to == ExecutionState::kRunning || to == ExecutionState::kCancelled;
        case ExecutionState::kRunning:
            return IsTerminal(to);
        default:
            return false;
    }
}

const char* ToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::kNormal: return "normal";
        case TerminationReason::kTimeout: return "timeout";
        case TerminationReason::kResourceLimit: return "resource_limit";
        case TerminationReason::kRunnerError: return "runner_error";
        case TerminationReason::kCancelled: return "cancelled";
    }
    return "unknown";
}

ExecutionState StateFor(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::kNormal: return ExecutionState::kCompleted;
        case TerminationReason::kTimeout:
        case TerminationReason::kResourceLimit: return ExecutionState::kTimedOut;
        case TerminationReason::kRunnerError: return ExecutionState::kFailed;
        case TerminationReason::kCancelled: return ExecutionState::kCancelled;
    }
    return ExecutionState::kFailed;
}

ExecutionResult RunnerFault(const std::string& message) {
    ExecutionResult result{};
    result.termination_reason = TerminationReason::kRunnerError;
    result.error = message;
    return result;
}

ExecutionResult CancelledResult() {
    ExecutionResult result{};
    result.termination_reason = TerminationReason::kCancelled;
    result.error = "cancelled by caller";
    return result;
}

}  // namespace sandbar::sandbox
