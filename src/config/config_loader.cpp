#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace sandbar::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> StringArray(const nlohmann::json& source) {
    std::vector<std::string> items;
    for (const auto& item : source) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

// Positive integers only; anything else keeps the default.
template <typename T>
void ApplyPositive(const nlohmann::json& source, const char* key, T& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        const auto value = source[key].get<long long>();
        if (value > 0) {
            target = static_cast<T>(value);
        }
    }
}

void ApplySandboxOverride(SandboxOverride& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("interpreter") && source["interpreter"].is_string()) {
        target.interpreter = source["interpreter"].get<std::string>();
    }
    if (source.contains("args") && source["args"].is_array()) {
        target.args = StringArray(source["args"]);
    }
    if (source.contains("allowedPackages") && source["allowedPackages"].is_array()) {
        target.allowed_packages = StringArray(source["allowedPackages"]);
    }
    if (source.contains("maxTimeoutMs") && source["maxTimeoutMs"].is_number_integer()) {
        target.max_timeout_ms = source["maxTimeoutMs"].get<long long>();
    }
    if (source.contains("maxMemoryBytes") && source["maxMemoryBytes"].is_number_integer()) {
        target.max_memory_bytes = source["maxMemoryBytes"].get<long long>();
    }
    if (source.contains("maxCpuShare") && source["maxCpuShare"].is_number()) {
        target.max_cpu_share = source["maxCpuShare"].get<double>();
    }
    if (source.contains("maxProcesses") && source["maxProcesses"].is_number_integer()) {
        target.max_processes = source["maxProcesses"].get<int>();
    }
    if (source.contains("containerImage") && source["containerImage"].is_string()) {
        target.container_image = source["containerImage"].get<std::string>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("SANDBAR_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".sandbar" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("scheduler") && data["scheduler"].is_object()) {
        const auto& scheduler = data["scheduler"];
        ApplyPositive(scheduler, "maxConcurrent", config.scheduler.max_concurrent);
        ApplyPositive(scheduler, "maxQueueDepth", config.scheduler.max_queue_depth);
        ApplyPositive(scheduler, "resultRetentionMs", config.scheduler.result_retention_ms);
    }

    if (data.contains("isolation") && data["isolation"].is_object()) {
        const auto& isolation = data["isolation"];
        if (isolation.contains("mode") && isolation["mode"].is_string()) {
            config.isolation.mode = isolation["mode"].get<std::string>();
        }
        if (isolation.contains("workspaceRoot") && isolation["workspaceRoot"].is_string()) {
            config.isolation.workspace_root = isolation["workspaceRoot"].get<std::string>();
        }
        if (isolation.contains("unshareNetwork") && isolation["unshareNetwork"].is_boolean()) {
            config.isolation.unshare_network = isolation["unshareNetwork"].get<bool>();
        }
        if (isolation.contains("privateMounts") && isolation["privateMounts"].is_boolean()) {
            config.isolation.private_mounts = isolation["privateMounts"].get<bool>();
        }
        if (isolation.contains("dropPrivileges") && isolation["dropPrivileges"].is_boolean()) {
            config.isolation.drop_privileges = isolation["dropPrivileges"].get<bool>();
        }
        ApplyPositive(isolation, "sandboxUidBase", config.isolation.sandbox_uid_base);
        if (isolation.contains("cgroupRoot") && isolation["cgroupRoot"].is_string()) {
            config.isolation.cgroup_root = isolation["cgroupRoot"].get<std::string>();
        }
        if (isolation.contains("containerRuntime") && isolation["containerRuntime"].is_string()) {
            config.isolation.container_runtime = isolation["containerRuntime"].get<std::string>();
        }
        ApplyPositive(isolation, "outputLimitBytes", config.isolation.output_limit_bytes);
        ApplyPositive(isolation, "fileSizeLimitBytes", config.isolation.file_size_limit_bytes);
        ApplyPositive(isolation, "openFilesLimit", config.isolation.open_files_limit);
        if (isolation.contains("niceness") && isolation["niceness"].is_number_integer()) {
            config.isolation.niceness = std::clamp(isolation["niceness"].get<int>(), 0, 19);
        }
    }

    if (data.contains("validator") && data["validator"].is_object()) {
        const auto& validator = data["validator"];
        ApplyPositive(validator, "maxSourceBytes", config.validator.max_source_bytes);
        ApplyPositive(validator, "maxWhitespaceRun", config.validator.max_whitespace_run);
        if (validator.contains("knownSignatures") && validator["knownSignatures"].is_array()) {
            config.validator.known_signatures = StringArray(validator["knownSignatures"]);
        }
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        if (gateway.contains("host") && gateway["host"].is_string()) {
            config.gateway.host = gateway["host"].get<std::string>();
        }
        ApplyPositive(gateway, "port", config.gateway.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            if (auto level = utils::ParseLogLevel(logging["level"].get<std::string>())) {
                config.logging.min_level = *level;
            }
        }
    }

    if (data.contains("sandboxes") && data["sandboxes"].is_object()) {
        for (const auto& [name, value] : data["sandboxes"].items()) {
            ApplySandboxOverride(config.sandboxes[name], value);
        }
    }
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto max_concurrent = GetEnvFallback(
        "SANDBAR_SCHEDULER__MAX_CONCURRENT",
        "SANDBAR_MAX_CONCURRENT");
    if (!max_concurrent.empty()) {
        const auto value = ParseInt(max_concurrent, config.scheduler.max_concurrent);
        if (value > 0) {
            config.scheduler.max_concurrent = value;
        }
    }

    const auto max_queue_depth = GetEnv("SANDBAR_SCHEDULER__MAX_QUEUE_DEPTH");
    if (!max_queue_depth.empty()) {
        const auto value = ParseInt(max_queue_depth, config.scheduler.max_queue_depth);
        if (value > 0) {
            config.scheduler.max_queue_depth = value;
        }
    }

    const auto retention = GetEnv("SANDBAR_SCHEDULER__RESULT_RETENTION_MS");
    if (!retention.empty()) {
        const auto value = ParseLong(retention, config.scheduler.result_retention_ms);
        if (value > 0) {
            config.scheduler.result_retention_ms = value;
        }
    }

    const auto mode = GetEnvFallback("SANDBAR_ISOLATION__MODE", "SANDBAR_ISOLATION_MODE");
    if (!mode.empty()) {
        config.isolation.mode = mode;
    }

    const auto workspace_root = GetEnvFallback(
        "SANDBAR_ISOLATION__WORKSPACE_ROOT",
        "SANDBAR_WORKSPACE_ROOT");
    if (!workspace_root.empty()) {
        config.isolation.workspace_root = workspace_root;
    }

    const auto unshare_network = GetEnv("SANDBAR_ISOLATION__UNSHARE_NETWORK");
    if (!unshare_network.empty()) {
        config.isolation.unshare_network = ParseBool(unshare_network);
    }

    const auto private_mounts = GetEnv("SANDBAR_ISOLATION__PRIVATE_MOUNTS");
    if (!private_mounts.empty()) {
        config.isolation.private_mounts = ParseBool(private_mounts);
    }

    const auto drop_privileges = GetEnv("SANDBAR_ISOLATION__DROP_PRIVILEGES");
    if (!drop_privileges.empty()) {
        config.isolation.drop_privileges = ParseBool(drop_privileges);
    }

    const auto cgroup_root = GetEnv("SANDBAR_ISOLATION__CGROUP_ROOT");
    if (!cgroup_root.empty()) {
        config.isolation.cgroup_root = cgroup_root;
    }

    const auto runtime = GetEnv("SANDBAR_ISOLATION__CONTAINER_RUNTIME");
    if (!runtime.empty()) {
        config.isolation.container_runtime = runtime;
    }

    const auto output_limit = GetEnv("SANDBAR_ISOLATION__OUTPUT_LIMIT_BYTES");
    if (!output_limit.empty()) {
        const auto value = ParseLong(output_limit, 0);
        if (value > 0) {
            config.isolation.output_limit_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto max_source = GetEnv("SANDBAR_VALIDATOR__MAX_SOURCE_BYTES");
    if (!max_source.empty()) {
        const auto value = ParseLong(max_source, 0);
        if (value > 0) {
            config.validator.max_source_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto signatures = GetEnv("SANDBAR_VALIDATOR__KNOWN_SIGNATURES");
    if (!signatures.empty()) {
        const auto extra = SplitCsv(signatures);
        config.validator.known_signatures.insert(
            config.validator.known_signatures.end(), extra.begin(), extra.end());
    }

    const auto host = GetEnvFallback("SANDBAR_GATEWAY__HOST", "SANDBAR_HOST");
    if (!host.empty()) {
        config.gateway.host = host;
    }

    const auto port = GetEnvFallback("SANDBAR_GATEWAY__PORT", "SANDBAR_PORT");
    if (!port.empty()) {
        const auto value = ParseInt(port, config.gateway.port);
        if (value > 0 && value < 65536) {
            config.gateway.port = value;
        }
    }

    const auto log_level = GetEnvFallback("SANDBAR_LOGGING__LEVEL", "SANDBAR_LOG_LEVEL");
    if (!log_level.empty()) {
        if (auto level = utils::ParseLogLevel(log_level)) {
            config.logging.min_level = *level;
        }
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        try {
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogLine(utils::LogLevel::kWarn, "config")
                << "ignoring " << path.string() << ": " << ex.what();
        }
    }

    ApplyEnvironmentOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace sandbar::config
