#include "collector/result_collector.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "runner/ephemeral_workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandbar::collector {
namespace {

constexpr std::size_t kMaxErrorBytes = 256;
constexpr int kCleanupAttempts = 3;
constexpr auto kCleanupBackoff = std::chrono::milliseconds(50);

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bus::ExecutionEventKind TerminalKind(sandbox::ExecutionState state) {
    switch (state) {
        case sandbox::ExecutionState::kCompleted: return bus::ExecutionEventKind::kCompleted;
        case sandbox::ExecutionState::kTimedOut: return bus::ExecutionEventKind::kTimedOut;
        case sandbox::ExecutionState::kCancelled: return bus::ExecutionEventKind::kCancelled;
        default: return bus::ExecutionEventKind::kFailed;
    }
}

}  // namespace

ResultCollector::ResultCollector(std::filesystem::path workspace_root, std::shared_ptr<bus::EventBus> bus)
    : workspace_root_(std::filesystem::absolute(workspace_root).lexically_normal())
    , bus_(std::move(bus)) {}

void ResultCollector::OnQueued(const scheduler::Execution& execution, std::size_t queue_position) {
    Publish(bus::ExecutionEventKind::kQueued, execution, sandbox::ExecutionState::kQueued, queue_position);
}

void ResultCollector::OnStarted(const scheduler::Execution& execution) {
    Publish(bus::ExecutionEventKind::kStarted, execution, sandbox::ExecutionState::kRunning);
}

void ResultCollector::OnCancelledWhileQueued(const scheduler::Execution& execution) {
    const auto result = sandbox::CancelledResult();
    Publish(bus::ExecutionEventKind::kCancelled, execution, sandbox::ExecutionState::kCancelled, 0, &result);
}

sandbox::ExecutionResult ResultCollector::Collect(const scheduler::Execution& execution,
                                                  sandbox::ExecutionResult raw) {
    if (raw.termination_reason == sandbox::TerminationReason::kRunnerError) {
        raw.stdout_text.clear();
        raw.stderr_text.clear();
        raw.exit_code.reset();
        raw.output_truncated = false;
    }
    raw.error = SanitizeError(raw.error);
    if (raw.elapsed_ms <= 0 && execution.started_at_ms > 0) {
        raw.elapsed_ms = utils::NowMs() - execution.started_at_ms;
    }
    if (!RemoveArtifact(execution.request.id)) {
        utils::LogLine(utils::LogLevel::kError, "collector")
            << "artifact for " << execution.request.id << " could not be removed";
    }
    const auto state = sandbox::StateFor(raw.termination_reason);
    Publish(TerminalKind(state), execution, state, 0, &raw);
    return raw;
}

std::filesystem::path ResultCollector::ArtifactPath(const std::string& execution_id) const {
    return runner::EphemeralWorkspace::PathFor(workspace_root_, execution_id);
}

bool ResultCollector::RemoveArtifact(const std::string& execution_id) {
    std::filesystem::path path;
    try {
        path = ArtifactPath(execution_id);
    } catch (const std::invalid_argument&) {
        return true;
    }
    for (int attempt = 1; attempt <= kCleanupAttempts; ++attempt) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec) {
            return true;
        }
        std::filesystem::remove_all(path, ec);
        if (!ec) {
            return true;
        }
        utils::LogLine(utils::LogLevel::kWarn, "collector") << "cleanup attempt " << attempt << " for "
                                                            << execution_id << " failed: " << ec.message();
        std::this_thread::sleep_for(kCleanupBackoff * attempt);
    }
    return false;
}

std::string ResultCollector::SanitizeError(const std::string& message) const {
    std::string text = message;
    ReplaceAll(text, workspace_root_.string(), "<workspace>");
    std::string cleaned;
    cleaned.reserve(text.size());
    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte == '\n' || byte == '\t') {
            cleaned.push_back(' ');
        } else if (byte >= 0x20 && byte != 0x7f) {
            cleaned.push_back(c);
        }
    }
    if (cleaned.size() > kMaxErrorBytes) {
        cleaned.resize(kMaxErrorBytes);
    }
    return utils::Trim(cleaned);
}

void ResultCollector::Publish(bus::ExecutionEventKind kind, const scheduler::Execution& execution,
                              sandbox::ExecutionState state, std::size_t queue_position,
                              const sandbox::ExecutionResult* result) {
    if (!bus_) {
        return;
    }
    bus::ExecutionEvent event;
    event.kind = kind;
    event.execution_id = execution.request.id;
    event.language = execution.request.language;
    event.state = state;
    event.queue_position = queue_position;
    if (result) {
        event.termination_reason = result->termination_reason;
        event.elapsed_ms = result->elapsed_ms;
    }
    event.timestamp = utils::Now();
    bus_->Publish(event);
}

}  // namespace sandbar::collector
