#include "gateway/http_gateway.hpp"

#include <chrono>

#include "service/wire_format.hpp"
#include "utils/logging.hpp"

namespace sandbar::gateway {
namespace {

constexpr const char* kJson = "application/json";
constexpr long long kWaitSlackMs = 5000;
constexpr const char* kExecutionRoute = R"(/executions/([A-Za-z0-9_\-]+))";

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(service::Dump(body), kJson);
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    SendJson(res, status, {{"error", message}});
}

int StatusFor(service::SubmitStatus status) {
    switch (status) {
        case service::SubmitStatus::kAccepted: return 202;
        case service::SubmitStatus::kRejected: return 403;
        case service::SubmitStatus::kSaturated: return 503;
        case service::SubmitStatus::kInvalid: return 400;
    }
    return 500;
}

bool WantsWait(const httplib::Request& req) {
    if (!req.has_param("wait")) {
        return false;
    }
    const auto value = req.get_param_value("wait");
    return value.empty() || value == "1" || value == "true";
}

}  // namespace

HttpGateway::HttpGateway(service::SandboxService& service, config::GatewayConfig config)
    : service_(service)
    , config_(std::move(config)) {
    RegisterRoutes();
}

HttpGateway::~HttpGateway() {
    Stop();
}

bool HttpGateway::Start() {
    if (running_.exchange(true)) {
        return true;
    }
    if (config_.port == 0) {
        port_ = server_.bind_to_any_port(config_.host);
    } else {
        port_ = server_.bind_to_port(config_.host, config_.port) ? config_.port : -1;
    }
    if (port_ <= 0) {
        utils::LogLine(utils::LogLevel::kError, "gateway") << "failed to listen on " << config_.host << ":"
                                                           << config_.port;
        running_ = false;
        return false;
    }
    thread_ = std::thread([this]() {
        if (!server_.listen_after_bind()) {
            utils::LogLine(utils::LogLevel::kError, "gateway") << "server loop ended with an error";
        }
    });
    utils::LogLine(utils::LogLevel::kInfo, "gateway") << "listening on " << config_.host << ":" << port_;
    return true;
}

void HttpGateway::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    server_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HttpGateway::RegisterRoutes() {
    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::LogLine(utils::LogLevel::kDebug, "gateway") << req.method << " " << req.path << " -> " << res.status;
    });

    server_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        HandleExecute(req, res);
    });
    server_.Get(kExecutionRoute, [this](const httplib::Request& req, httplib::Response& res) {
        HandlePoll(req, res);
    });
    server_.Delete(kExecutionRoute, [this](const httplib::Request& req, httplib::Response& res) {
        HandleCancel(req, res);
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {
            {"status", "ok"},
            {"service", "sandbar"},
            {"queue", service::QueueStatusToJson(service_.QueueStatus())}
        });
    });
    server_.Get("/queue", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, service::QueueStatusToJson(service_.QueueStatus()));
    });
    server_.Get("/sandboxes", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, service::SandboxesToJson(service_.Registry()));
    });
}

void HttpGateway::HandleExecute(const httplib::Request& req, httplib::Response& res) {
    const auto parsed = service::ParseSubmitRequest(req.body);
    if (!parsed.request) {
        SendError(res, 400, parsed.error);
        return;
    }
    const auto response = service_.Submit(*parsed.request);
    if (response.status != service::SubmitStatus::kAccepted || !WantsWait(req)) {
        SendJson(res, StatusFor(response.status), service::SubmitResponseToJson(response));
        return;
    }
    const auto bound = std::chrono::milliseconds(response.options.timeout_ms + kWaitSlackMs);
    const bool finished = service_.Wait(response.execution_id, bound).has_value();
    const auto poll = service_.Poll(response.execution_id);
    SendJson(res, finished ? 200 : 202, service::PollResponseToJson(poll));
}

void HttpGateway::HandlePoll(const httplib::Request& req, httplib::Response& res) {
    const auto poll = service_.Poll(req.matches[1]);
    if (!poll.found) {
        SendError(res, 404, "unknown execution id");
        return;
    }
    SendJson(res, 200, service::PollResponseToJson(poll));
}

void HttpGateway::HandleCancel(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    if (!service_.Poll(id).found) {
        SendError(res, 404, "unknown execution id");
        return;
    }
    SendJson(res, 200, {{"executionId", id}, {"cancelled", service_.Cancel(id)}});
}

}  // namespace sandbar::gateway
