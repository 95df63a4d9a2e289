#include "sandbox/sandbox_registry.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/logging.hpp"

namespace sandbar::sandbox {
namespace {

constexpr long long kMiB = 1024LL * 1024LL;

ResourceCeilings Ceilings(long long timeout_ms, long long memory_mib, double cpu_share, int processes) {
    return ResourceCeilings{
        .timeout_ms = timeout_ms,
        .memory_bytes = memory_mib * kMiB,
        .cpu_share = cpu_share,
        .max_processes = processes};
}

void ApplyOverride(SandboxDescriptor& descriptor, const config::SandboxOverride& override_config) {
    if (override_config.interpreter && !override_config.interpreter->empty()) {
        descriptor.interpreter = *override_config.interpreter;
    }
    if (override_config.args) {
        descriptor.interpreter_args = *override_config.args;
    }
    if (override_config.allowed_packages) {
        descriptor.allowed_packages = std::set<std::string>(
            override_config.allowed_packages->begin(), override_config.allowed_packages->end());
    }
    if (override_config.max_timeout_ms && *override_config.max_timeout_ms > 0) {
        descriptor.maximums.timeout_ms = *override_config.max_timeout_ms;
    }
    if (override_config.max_memory_bytes && *override_config.max_memory_bytes > 0) {
        descriptor.maximums.memory_bytes = *override_config.max_memory_bytes;
    }
    if (override_config.max_cpu_share && *override_config.max_cpu_share > 0.0) {
        descriptor.maximums.cpu_share = *override_config.max_cpu_share;
    }
    if (override_config.max_processes && *override_config.max_processes > 0) {
        descriptor.maximums.max_processes = *override_config.max_processes;
    }
    if (override_config.container_image && !override_config.container_image->empty()) {
        descriptor.container_image = *override_config.container_image;
    }
    auto& defaults = descriptor.defaults;
    const auto& maximums = descriptor.maximums;
    defaults.timeout_ms = std::min(defaults.timeout_ms, maximums.timeout_ms);
    defaults.memory_bytes = std::min(defaults.memory_bytes, maximums.memory_bytes);
    defaults.cpu_share = std::min(defaults.cpu_share, maximums.cpu_share);
    defaults.max_processes = std::min(defaults.max_processes, maximums.max_processes);
}

}  // namespace

SandboxRegistry::SandboxRegistry(std::vector<SandboxDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {}

std::vector<SandboxDescriptor> SandboxRegistry::BuiltInDescriptors() {
    std::vector<SandboxDescriptor> descriptors;

    SandboxDescriptor python{};
    python.language = Language::kPython;
    python.name = "Python 3";
    python.interpreter = "/usr/bin/python3";
    python.interpreter_args = {"-B", "-I"};
    python.file_extension = ".py";
    python.allowed_packages = {
        "math", "decimal", "fractions", "statistics", "collections", "heapq",
        "bisect", "string", "re", "itertools", "functools", "operator",
        "json", "csv", "datetime", "calendar", "typing", "random",
        "numpy", "pandas", "matplotlib", "scipy", "sklearn", "seaborn"};
    python.defaults = Ceilings(30000, 256, 0.5, 64);
    python.maximums = Ceilings(30000, 256, 0.5, 64);
    python.container_image = "python:3.11-slim";
    descriptors.push_back(python);

    SandboxDescriptor javascript{};
    javascript.language = Language::kJavaScript;
    javascript.name = "Node.js";
    javascript.interpreter = "/usr/bin/node";
    javascript.interpreter_args = {"--no-deprecation", "--disable-proto=delete"};
    javascript.file_extension = ".js";
    javascript.allowed_packages = {"lodash", "moment", "uuid", "mathjs", "ml-matrix"};
    javascript.defaults = Ceilings(30000, 256, 0.5, 64);
    javascript.maximums = Ceilings(30000, 256, 0.5, 64);
    javascript.container_image = "node:20-slim";
    javascript.limit_address_space = false;
    javascript.heap_limit_flag = "--max-old-space-size=";
    javascript.data_limit_allowance_bytes = 256LL * 1024 * 1024;
    descriptors.push_back(javascript);

    SandboxDescriptor shell{};
    shell.language = Language::kShell;
    shell.name = "Bash";
    shell.interpreter = "/bin/bash";
    shell.interpreter_args = {"-r"};
    shell.file_extension = ".sh";
    shell.defaults = Ceilings(15000, 128, 0.5, 32);
    shell.maximums = Ceilings(15000, 128, 0.5, 32);
    shell.container_image = "bash:5.2";
    descriptors.push_back(shell);

    return descriptors;
}

std::shared_ptr<const SandboxRegistry> SandboxRegistry::BuiltIn() {
    return std::make_shared<const SandboxRegistry>(BuiltInDescriptors());
}

std::shared_ptr<const SandboxRegistry> SandboxRegistry::FromConfig(const config::Config& config) {
    auto descriptors = BuiltInDescriptors();
    for (const auto& [name, override_config] : config.sandboxes) {
        const auto language = ParseLanguage(name);
        if (!language) {
            utils::LogLine(utils::LogLevel::kWarn, "registry") << "unknown sandbox override: " << name;
            continue;
        }
        for (auto& descriptor : descriptors) {
            if (descriptor.language == *language) {
                ApplyOverride(descriptor, override_config);
            }
        }
    }
    return std::make_shared<const SandboxRegistry>(std::move(descriptors));
}

const SandboxDescriptor* SandboxRegistry::Find(Language language) const {
    for (const auto& descriptor : descriptors_) {
        if (descriptor.language == language) {
            return &descriptor;
        }
    }
    return nullptr;
}

const SandboxDescriptor& SandboxRegistry::Get(Language language) const {
    const auto* descriptor = Find(language);
    if (!descriptor) {
        throw std::out_of_range(std::string("no sandbox for language ") + ToString(language));
    }
    return *descriptor;
}

bool SandboxRegistry::IsPackageAllowed(Language language, std::string_view package) const {
    const auto* descriptor = Find(language);
    if (!descriptor) {
        return false;
    }
    return descriptor->allowed_packages.count(std::string(package)) > 0;
}

OptionsResolution SandboxRegistry::ResolveOptions(Language language,
                                                  const RequestedOptions& requested) const {
    OptionsResolution resolution{};
    const auto* descriptor = Find(language);
    if (!descriptor) {
        resolution.error = std::string("unsupported language: ") + ToString(language);
        return resolution;
    }
    if (requested.timeout_ms && *requested.timeout_ms <= 0) {
        resolution.error = "timeoutMs must be positive";
        return resolution;
    }
    if (requested.memory_ceiling_bytes && *requested.memory_ceiling_bytes <= 0) {
        resolution.error = "memoryBytes must be positive";
        return resolution;
    }
    if (requested.cpu_share && !(*requested.cpu_share > 0.0)) {
        resolution.error = "cpuShare must be positive";
        return resolution;
    }

    const auto& defaults = descriptor->defaults;
    const auto& maximums = descriptor->maximums;
    ExecutionOptions options{};
    options.timeout_ms = std::min(requested.timeout_ms.value_or(defaults.timeout_ms), maximums.timeout_ms);
    options.memory_ceiling_bytes = std::min(
        requested.memory_ceiling_bytes.value_or(defaults.memory_bytes), maximums.memory_bytes);
    options.cpu_share = std::min(requested.cpu_share.value_or(defaults.cpu_share), maximums.cpu_share);
    options.max_processes = std::min(defaults.max_processes, maximums.max_processes);
    resolution.options = options;
    return resolution;
}

}  // namespace sandbar::sandbox
