#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sandbar::sandbox {

enum class Language {
    kPython,
    kJavaScript,
    kShell
};

const char* ToString(Language language);
std::optional<Language> ParseLanguage(std::string_view name);

struct ExecutionOptions {
    long long timeout_ms = 0;
    long long memory_ceiling_bytes = 0;
    double cpu_share = 0.0;
    int max_processes = 0;
};

// Caller-supplied limits before clamping; empty fields take the language default.
struct RequestedOptions {
    std::optional<long long> timeout_ms;
    std::optional<long long> memory_ceiling_bytes;
    std::optional<double> cpu_share;
};

struct ExecutionRequest {
    std::string id;
    std::string source_code;
    Language language = Language::kPython;
    ExecutionOptions options;
};

enum class ExecutionState {
    kQueued,
    kRunning,
    kCompleted,
    kFailed,
    kTimedOut,
    kCancelled
};

const char* ToString(ExecutionState state);
bool IsTerminal(ExecutionState state);
// Queued -> Running -> {Completed, Failed, TimedOut}; Queued|Running -> Cancelled.
bool IsAllowedTransition(ExecutionState from, ExecutionState to);

enum class TerminationReason {
    kNormal,
    kTimeout,
    kResourceLimit,
    kRunnerError,
    kCancelled
};

const char* ToString(TerminationReason reason);
ExecutionState StateFor(TerminationReason reason);

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    long long elapsed_ms = 0;
    TerminationReason termination_reason = TerminationReason::kNormal;
    bool output_truncated = false;
    std::string error;
};

ExecutionResult RunnerFault(const std::string& message);
ExecutionResult CancelledResult();

}  // namespace sandbar::sandbox
