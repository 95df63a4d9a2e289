#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "scheduler/scheduler.hpp"
#include "service/sandbox_service.hpp"
#include "validator/violation.hpp"

namespace sandbar::service {

struct ParsedSubmit {
    std::optional<SubmitRequest> request;
    std::string error;
};

// Accepts {sourceCode|code, language, timeoutMs?, memoryBytes?, cpuShare?}.
ParsedSubmit ParseSubmitRequest(const std::string& body);

nlohmann::json ViolationToJson(const validator::Violation& violation);
nlohmann::json VerdictToJson(const validator::ValidationVerdict& verdict);
nlohmann::json OptionsToJson(const sandbox::ExecutionOptions& options);
nlohmann::json ResultToJson(const sandbox::ExecutionResult& result);
nlohmann::json SubmitResponseToJson(const SubmitResponse& response);
nlohmann::json PollResponseToJson(const PollResponse& response);
nlohmann::json QueueStatusToJson(const scheduler::Scheduler::QueueStatus& status);
nlohmann::json SandboxesToJson(const sandbox::SandboxRegistry& registry);

// Program output is arbitrary bytes; invalid UTF-8 is replaced, never thrown on.
std::string Dump(const nlohmann::json& json, int indent = -1);

}  // namespace sandbar::service
