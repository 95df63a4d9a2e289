#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_types.hpp"

namespace sandbar::sandbox {

struct ResourceCeilings {
    long long timeout_ms = 0;
    long long memory_bytes = 0;
    double cpu_share = 0.0;
    int max_processes = 0;
};

enum class NetworkPolicy {
    kNone
};

struct SandboxDescriptor {
    Language language = Language::kPython;
    std::string name;
    std::string interpreter;
    std::vector<std::string> interpreter_args;
    std::string file_extension;
    std::set<std::string> allowed_packages;
    ResourceCeilings defaults;
    ResourceCeilings maximums;
    NetworkPolicy network = NetworkPolicy::kNone;
    std::string container_image;
    // V8 reserves far more address space than it uses, so node is bounded by
    // its heap flag and RLIMIT_DATA (and the cgroup when configured) instead of RLIMIT_AS.
    bool limit_address_space = true;
    std::string heap_limit_flag;
    // Added to the ceiling for RLIMIT_DATA: thread stacks, code space, runtime.
    long long data_limit_allowance_bytes = 0;
};

struct OptionsResolution {
    std::optional<ExecutionOptions> options;
    std::string error;
};

class SandboxRegistry {
public:
    explicit SandboxRegistry(std::vector<SandboxDescriptor> descriptors);

    static std::vector<SandboxDescriptor> BuiltInDescriptors();
    static std::shared_ptr<const SandboxRegistry> BuiltIn();
    static std::shared_ptr<const SandboxRegistry> FromConfig(const config::Config& config);

    const SandboxDescriptor* Find(Language language) const;
    // Throws std::out_of_range for a language without a descriptor.
    const SandboxDescriptor& Get(Language language) const;
    const std::vector<SandboxDescriptor>& All() const { return descriptors_; }

    bool IsPackageAllowed(Language language, std::string_view package) const;

    // Applies defaults and clamps to the language maximums; callers can only tighten.
    OptionsResolution ResolveOptions(Language language, const RequestedOptions& requested) const;

private:
    std::vector<SandboxDescriptor> descriptors_;
};

}  // namespace sandbar::sandbox
