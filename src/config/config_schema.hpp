#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace sandbar::config {

struct SchedulerConfig {
    int max_concurrent = 3;
    int max_queue_depth = 32;
    long long result_retention_ms = 60 * 1000;
};

struct IsolationConfig {
    // "process" (namespaces + rlimits) or "container".
    std::string mode = "process";
    std::string workspace_root = "/tmp/sandbar";
    bool unshare_network = true;
    bool private_mounts = true;
    bool drop_privileges = true;
    int sandbox_uid_base = 60000;
    std::string cgroup_root;
    std::string container_runtime = "docker";
    std::size_t output_limit_bytes = 10000;
    long long file_size_limit_bytes = 1024 * 1024;
    int open_files_limit = 64;
    int niceness = 19;
};

struct ValidatorConfig {
    std::size_t max_source_bytes = 5000;
    std::size_t max_whitespace_run = 64;
    std::vector<std::string> known_signatures;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 3002;
};

struct SandboxOverride {
    std::optional<std::string> interpreter;
    std::optional<std::vector<std::string>> args;
    std::optional<std::vector<std::string>> allowed_packages;
    std::optional<long long> max_timeout_ms;
    std::optional<long long> max_memory_bytes;
    std::optional<double> max_cpu_share;
    std::optional<int> max_processes;
    std::optional<std::string> container_image;
};

struct Config {
    SchedulerConfig scheduler;
    IsolationConfig isolation;
    ValidatorConfig validator;
    GatewayConfig gateway;
    utils::LogConfig logging;
    std::map<std::string, SandboxOverride> sandboxes;
};

}  // namespace sandbar::config
