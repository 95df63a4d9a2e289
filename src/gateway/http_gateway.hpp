#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "service/sandbox_service.hpp"

namespace sandbar::gateway {

// JSON-over-HTTP transport for the sandbox service. Every submission goes
// through SandboxService::Submit.
class HttpGateway {
public:
    HttpGateway(service::SandboxService& service, config::GatewayConfig config);
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    // Binds and starts serving on a background thread. Port 0 picks a free port.
    bool Start();
    void Stop();
    int Port() const { return port_; }

private:
    void RegisterRoutes();
    void HandleExecute(const httplib::Request& req, httplib::Response& res);
    void HandlePoll(const httplib::Request& req, httplib::Response& res);
    void HandleCancel(const httplib::Request& req, httplib::Response& res);

    service::SandboxService& service_;
    config::GatewayConfig config_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    int port_ = 0;
};

}  // namespace sandbar::gateway
