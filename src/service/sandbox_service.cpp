#include "service/sandbox_service.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandbar::service {
namespace {

void LogEvent(const bus::ExecutionEvent& event) {
    utils::LogLine line(utils::LogLevel::kDebug, "events");
    line << bus::ToString(event.kind) << " " << event.execution_id << " ("
         << sandbox::ToString(event.language) << ")";
    if (event.queue_position > 0) {
        line << " position " << event.queue_position;
    }
    if (event.termination_reason) {
        line << " " << sandbox::ToString(*event.termination_reason) << " after " << event.elapsed_ms << " ms";
    }
}

}  // namespace

const char* ToString(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::kAccepted: return "accepted";
        case SubmitStatus::kRejected: return "rejected";
        case SubmitStatus::kSaturated: return "saturated";
        case SubmitStatus::kInvalid: return "invalid";
    }
    return "unknown";
}

SandboxService::SandboxService(const config::Config& config)
    : SandboxService(config, sandbox::SandboxRegistry::FromConfig(config), runner::CreateRunner(config.isolation)) {}

SandboxService::SandboxService(const config::Config& config,
                               std::shared_ptr<const sandbox::SandboxRegistry> registry,
                               std::unique_ptr<runner::Runner> runner)
    : registry_(std::move(registry))
    , validator_(registry_, config.validator)
    , bus_(std::make_shared<bus::EventBus>())
    , collector_(std::make_shared<collector::ResultCollector>(config.isolation.workspace_root, bus_))
    , scheduler_(config.scheduler, registry_, std::move(runner), collector_) {
    bus_->Subscribe(LogEvent);
}

SandboxService::~SandboxService() {
    Stop();
}

void SandboxService::Start() {
    if (started_) {
        return;
    }
    started_ = true;
    dispatcher_ = std::thread([this]() { bus_->Dispatch(); });
    scheduler_.Start();
}

void SandboxService::Stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    scheduler_.Stop();
    bus_->Stop();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

SubmitResponse SandboxService::Submit(const SubmitRequest& request) {
    SubmitResponse response;
    const auto language = sandbox::ParseLanguage(request.language);
    if (!language) {
        response.status = SubmitStatus::kInvalid;
        response.message = "unsupported language: " + request.language;
        return response;
    }
    if (!registry_->Find(*language)) {
        response.status = SubmitStatus::kInvalid;
        response.message = std::string("no sandbox configured for ") + sandbox::ToString(*language);
        return response;
    }
    const auto resolved = registry_->ResolveOptions(*language, request.options);
    if (!resolved.options) {
        response.status = SubmitStatus::kInvalid;
        response.message = resolved.error;
        return response;
    }

    auto verdict = validator_.Validate(request.source_code, *language);
    if (!verdict.accepted) {
        response.status = SubmitStatus::kRejected;
        response.violations = std::move(verdict.violations);
        response.message = "code rejected by static validation";
        const auto& first = response.violations.front();
        utils::LogLine(utils::LogLevel::kInfo, "validator")
            << "rejected " << sandbox::ToString(*language) << " submission: " << response.violations.size()
            << " violation(s), first " << validator::ToString(first.kind) << " '" << first.pattern
            << "' on line " << first.line;
        return response;
    }

    sandbox::ExecutionRequest execution_request;
    execution_request.id = utils::GenerateExecutionId();
    execution_request.source_code = request.source_code;
    execution_request.language = *language;
    execution_request.options = *resolved.options;

    const auto id = execution_request.id;
    const auto admission = scheduler_.Submit(std::move(execution_request));
    switch (admission.status) {
        case scheduler::AdmissionStatus::kAdmitted:
            response.status = SubmitStatus::kAccepted;
            response.execution_id = id;
            response.queue_position = admission.queue_position;
            response.options = *resolved.options;
            return response;
        case scheduler::AdmissionStatus::kSaturated:
            response.status = SubmitStatus::kSaturated;
            response.message = "execution queue is full, retry later";
            return response;
        case scheduler::AdmissionStatus::kStopped:
            response.status = SubmitStatus::kSaturated;
            response.message = "service is shutting down";
            return response;
        case scheduler::AdmissionStatus::kDuplicate:
            break;
    }
    response.status = SubmitStatus::kInvalid;
    response.message = "duplicate execution id";
    return response;
}

PollResponse SandboxService::Poll(const std::string& execution_id) {
    PollResponse response;
    response.execution_id = execution_id;
    const auto snapshot = scheduler_.Snapshot(execution_id);
    if (!snapshot) {
        return response;
    }
    response.found = true;
    response.state = snapshot->state;
    response.queue_position = snapshot->queue_position;
    response.result = snapshot->result;
    return response;
}

bool SandboxService::Cancel(const std::string& execution_id) {
    return scheduler_.Cancel(execution_id);
}

std::optional<sandbox::ExecutionResult> SandboxService::Wait(const std::string& execution_id,
                                                             std::chrono::milliseconds timeout) {
    return scheduler_.Wait(execution_id, timeout);
}

scheduler::Scheduler::QueueStatus SandboxService::QueueStatus() {
    return scheduler_.Status();
}

std::filesystem::path SandboxService::ArtifactPath(const std::string& execution_id) const {
    return collector_->ArtifactPath(execution_id);
}

}  // namespace sandbar::service
