#include "service/wire_format.hpp"

#include <type_traits>

namespace sandbar::service {
namespace {

// Reads an optional numeric field; a present field of the wrong type is an error.
template <typename T>
bool ReadNumber(const nlohmann::json& json, const char* key, std::optional<T>& out, std::string& error) {
    if (!json.contains(key) || json[key].is_null()) {
        return true;
    }
    const auto& value = json[key];
    if (!value.is_number()) {
        error = std::string(key) + " must be a number";
        return false;
    }
    if constexpr (std::is_integral_v<T>) {
        if (!value.is_number_integer()) {
            error = std::string(key) + " must be an integer";
            return false;
        }
    }
    out = value.get<T>();
    return true;
}

nlohmann::json CeilingsToJson(const sandbox::ResourceCeilings& ceilings) {
    return {
        {"timeoutMs", ceilings.timeout_ms},
        {"memoryBytes", ceilings.memory_bytes},
        {"cpuShare", ceilings.cpu_share},
        {"maxProcesses", ceilings.max_processes}
    };
}

}  // namespace

ParsedSubmit ParseSubmitRequest(const std::string& body) {
    ParsedSubmit parsed;
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& ex) {
        parsed.error = std::string("invalid JSON: ") + ex.what();
        return parsed;
    }
    if (!json.is_object()) {
        parsed.error = "request body must be a JSON object";
        return parsed;
    }

    SubmitRequest request;
    const char* source_key = json.contains("sourceCode") ? "sourceCode" : "code";
    if (!json.contains(source_key) || !json[source_key].is_string()) {
        parsed.error = "sourceCode must be a string";
        return parsed;
    }
    request.source_code = json[source_key].get<std::string>();
    if (!json.contains("language") || !json["language"].is_string()) {
        parsed.error = "language must be a string";
        return parsed;
    }
    request.language = json["language"].get<std::string>();

    std::string error;
    if (!ReadNumber(json, "timeoutMs", request.options.timeout_ms, error) ||
        !ReadNumber(json, json.contains("memoryBytes") ? "memoryBytes" : "memoryCeilingBytes",
                    request.options.memory_ceiling_bytes, error) ||
        !ReadNumber(json, "cpuShare", request.options.cpu_share, error)) {
        parsed.error = error;
        return parsed;
    }
    parsed.request = std::move(request);
    return parsed;
}

nlohmann::json ViolationToJson(const validator::Violation& violation) {
    return {
        {"layer", validator::ToString(violation.layer)},
        {"kind", validator::ToString(violation.kind)},
        {"pattern", violation.pattern},
        {"excerpt", violation.excerpt},
        {"line", violation.line}
    };
}

nlohmann::json VerdictToJson(const validator::ValidationVerdict& verdict) {
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : verdict.violations) {
        violations.push_back(ViolationToJson(violation));
    }
    return {{"accepted", verdict.accepted}, {"violations", violations}};
}

nlohmann::json OptionsToJson(const sandbox::ExecutionOptions& options) {
    return {
        {"timeoutMs", options.timeout_ms},
        {"memoryBytes", options.memory_ceiling_bytes},
        {"cpuShare", options.cpu_share},
        {"maxProcesses", options.max_processes}
    };
}

nlohmann::json ResultToJson(const sandbox::ExecutionResult& result) {
    nlohmann::json json = {
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exitCode", result.exit_code.has_value() ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr)},
        {"elapsedMs", result.elapsed_ms},
        {"terminationReason", sandbox::ToString(result.termination_reason)},
        {"outputTruncated", result.output_truncated}
    };
    if (!result.error.empty()) {
        json["error"] = result.error;
    }
    return json;
}

nlohmann::json SubmitResponseToJson(const SubmitResponse& response) {
    nlohmann::json json = {{"status", ToString(response.status)}};
    switch (response.status) {
        case SubmitStatus::kAccepted:
            json["executionId"] = response.execution_id;
            json["state"] = sandbox::ToString(sandbox::ExecutionState::kQueued);
            json["queuePosition"] = response.queue_position;
            json["options"] = OptionsToJson(response.options);
            break;
        case SubmitStatus::kRejected: {
            nlohmann::json violations = nlohmann::json::array();
            for (const auto& violation : response.violations) {
                violations.push_back(ViolationToJson(violation));
            }
            json["violations"] = violations;
            json["error"] = response.message;
            break;
        }
        case SubmitStatus::kSaturated:
        case SubmitStatus::kInvalid:
            json["error"] = response.message;
            break;
    }
    return json;
}

nlohmann::json PollResponseToJson(const PollResponse& response) {
    nlohmann::json json = {
        {"executionId", response.execution_id},
        {"state", sandbox::ToString(response.state)}
    };
    if (response.state == sandbox::ExecutionState::kQueued) {
        json["queuePosition"] = response.queue_position;
    }
    if (response.result) {
        json.update(ResultToJson(*response.result));
    }
    return json;
}

nlohmann::json QueueStatusToJson(const scheduler::Scheduler::QueueStatus& status) {
    return {
        {"queued", status.queued},
        {"running", status.running},
        {"retained", status.retained},
        {"maxConcurrent", status.max_concurrent},
        {"maxQueueDepth", status.max_queue_depth}
    };
}

nlohmann::json SandboxesToJson(const sandbox::SandboxRegistry& registry) {
    nlohmann::json sandboxes = nlohmann::json::array();
    for (const auto& descriptor : registry.All()) {
        sandboxes.push_back({
            {"language", sandbox::ToString(descriptor.language)},
            {"name", descriptor.name},
            {"interpreter", descriptor.interpreter},
            {"fileExtension", descriptor.file_extension},
            {"allowedPackages", descriptor.allowed_packages},
            {"defaults", CeilingsToJson(descriptor.defaults)},
            {"maximums", CeilingsToJson(descriptor.maximums)},
            {"network", "none"},
            {"containerImage", descriptor.container_image}
        });
    }
    return sandboxes;
}

std::string Dump(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace sandbar::service
