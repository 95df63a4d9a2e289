#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "sandbox/sandbox_registry.hpp"
#include "sandbox/sandbox_types.hpp"

using sandbar::sandbox::ExecutionState;
using sandbar::sandbox::Language;
using sandbar::sandbox::RequestedOptions;
using sandbar::sandbox::SandboxRegistry;
using sandbar::sandbox::TerminationReason;

// NOLINTNEXTLINE
TEST(sandbox_types, language_names_and_aliases) {
    EXPECT_EQ(sandbar::sandbox::ParseLanguage("python"), Language::kPython);
    EXPECT_EQ(sandbar::sandbox::ParseLanguage(" PY "), Language::kPython);
    EXPECT_EQ(sandbar::sandbox::ParseLanguage("node"), Language::kJavaScript);
    EXPECT_EQ(sandbar::sandbox::ParseLanguage("JS"), Language::kJavaScript);
    EXPECT_EQ(sandbar::sandbox::ParseLanguage("bash"), Language::kShell);
    EXPECT_EQ(sandbar::sandbox::ParseLanguage("sh"), Language::kShell);
    EXPECT_FALSE(sandbar::sandbox::ParseLanguage("ruby").has_value());
    EXPECT_STREQ(sandbar::sandbox::ToString(Language::kJavaScript), "javascript");
}

// NOLINTNEXTLINE
TEST(sandbox_types, state_machine_is_monotonic) {
    using S = ExecutionState;
    EXPECT_TRUE(sandbar::sandbox::IsAllowedTransition(S::kQueued, S::kRunning));
    EXPECT_TRUE(sandbar::sandbox::IsAllowedTransition(S::kQueued, S::kCancelled));
    EXPECT_TRUE(sandbar::sandbox::IsAllowedTransition(S::kRunning, S::kCompleted));
    EXPECT_TRUE(sandbar::sandbox::IsAllowedTransition(S::kRunning, S::kFailed));
    EXPECT_TRUE(sandbar::sandbox::IsAllowedTransition(S::kRunning, S::kTimedOut));
    EXPECT_TRUE(sandbar::sandbox::IsAllowedTransition(S::kRunning, S::kCancelled));

    EXPECT_FALSE(sandbar::sandbox::IsAllowedTransition(S::kQueued, S::kCompleted));
    EXPECT_FALSE(sandbar::sandbox::IsAllowedTransition(S::kRunning, S::kQueued));
    for (const auto terminal : {S::kCompleted, S::kFailed, S::kTimedOut, S::kCancelled}) {
        EXPECT_TRUE(sandbar::sandbox::IsTerminal(terminal));
        for (const auto next : {S::kQueued, S::kRunning, S::kCompleted, S::kFailed, S::kTimedOut, S::kCancelled}) {
            EXPECT_FALSE(sandbar::sandbox::IsAllowedTransition(terminal, next));
        }
    }
}

// NOLINTNEXTLINE
TEST(sandbox_types, termination_reasons_map_to_states) {
    EXPECT_EQ(sandbar::sandbox::StateFor(TerminationReason::kNormal), ExecutionState::kCompleted);
    EXPECT_EQ(sandbar::sandbox::StateFor(TerminationReason::kTimeout), ExecutionState::kTimedOut);
    EXPECT_EQ(sandbar::sandbox::StateFor(TerminationReason::kResourceLimit), ExecutionState::kTimedOut);
    EXPECT_EQ(sandbar::sandbox::StateFor(TerminationReason::kRunnerError), ExecutionState::kFailed);
    EXPECT_EQ(sandbar::sandbox::StateFor(TerminationReason::kCancelled), ExecutionState::kCancelled);
    EXPECT_STREQ(sandbar::sandbox::ToString(ExecutionState::kTimedOut), "timed_out");
    EXPECT_STREQ(sandbar::sandbox::ToString(TerminationReason::kResourceLimit), "resource_limit");
}

// NOLINTNEXTLINE
TEST(sandbox_registry, built_in_languages_have_descriptors) {
    const auto registry = SandboxRegistry::BuiltIn();
    ASSERT_EQ(registry->All().size(), 3u);
    for (const auto language : {Language::kPython, Language::kJavaScript, Language::kShell}) {
        const auto& descriptor = registry->Get(language);
        EXPECT_FALSE(descriptor.interpreter.empty());
        EXPECT_FALSE(descriptor.file_extension.empty());
        EXPECT_EQ(descriptor.network, sandbar::sandbox::NetworkPolicy::kNone);
        EXPECT_LE(descriptor.defaults.timeout_ms, descriptor.maximums.timeout_ms);
        EXPECT_LE(descriptor.defaults.memory_bytes, descriptor.maximums.memory_bytes);
    }
    EXPECT_TRUE(registry->IsPackageAllowed(Language::kPython, "numpy"));
    EXPECT_FALSE(registry->IsPackageAllowed(Language::kPython, "requests"));
    EXPECT_TRUE(registry->IsPackageAllowed(Language::kJavaScript, "lodash"));
    EXPECT_FALSE(registry->IsPackageAllowed(Language::kShell, "curl"));
}

// NOLINTNEXTLINE
TEST(sandbox_registry, missing_language_throws) {
    const SandboxRegistry registry(std::vector<sandbar::sandbox::SandboxDescriptor>{});
    EXPECT_EQ(registry.Find(Language::kPython), nullptr);
    EXPECT_THROW(registry.Get(Language::kPython), std::out_of_range);
    EXPECT_FALSE(registry.ResolveOptions(Language::kPython, {}).options.has_value());
}

// NOLINTNEXTLINE
TEST(sandbox_registry, options_default_and_clamp_to_maximums) {
    const auto registry = SandboxRegistry::BuiltIn();
    const auto& shell = registry->Get(Language::kShell);

    auto resolution = registry->ResolveOptions(Language::kShell, {});
    ASSERT_TRUE(resolution.options.has_value());
    EXPECT_EQ(resolution.options->timeout_ms, shell.defaults.timeout_ms);
    EXPECT_EQ(resolution.options->memory_ceiling_bytes, shell.defaults.memory_bytes);
    EXPECT_EQ(resolution.options->max_processes, shell.defaults.max_processes);

    RequestedOptions requested;
    requested.timeout_ms = 1000;
    requested.memory_ceiling_bytes = 16LL * 1024 * 1024;
    resolution = registry->ResolveOptions(Language::kShell, requested);
    ASSERT_TRUE(resolution.options.has_value());
    EXPECT_EQ(resolution.options->timeout_ms, 1000);
    EXPECT_EQ(resolution.options->memory_ceiling_bytes, 16LL * 1024 * 1024);

    requested.timeout_ms = shell.maximums.timeout_ms * 10;
    requested.memory_ceiling_bytes = shell.maximums.memory_bytes * 10;
    requested.cpu_share = 8.0;
    resolution = registry->ResolveOptions(Language::kShell, requested);
    ASSERT_TRUE(resolution.options.has_value());
    EXPECT_EQ(resolution.options->timeout_ms, shell.maximums.timeout_ms);
    EXPECT_EQ(resolution.options->memory_ceiling_bytes, shell.maximums.memory_bytes);
    EXPECT_DOUBLE_EQ(resolution.options->cpu_share, shell.maximums.cpu_share);
}

// NOLINTNEXTLINE
TEST(sandbox_registry, non_positive_options_are_invalid) {
    const auto registry = SandboxRegistry::BuiltIn();
    RequestedOptions requested;
    requested.timeout_ms = 0;
    auto resolution = registry->ResolveOptions(Language::kPython, requested);
    EXPECT_FALSE(resolution.options.has_value());
    EXPECT_EQ(resolution.error, "timeoutMs must be positive");

    requested = {};
    requested.memory_ceiling_bytes = -1;
    EXPECT_FALSE(registry->ResolveOptions(Language::kPython, requested).options.has_value());

    requested = {};
    requested.cpu_share = 0.0;
    EXPECT_FALSE(registry->ResolveOptions(Language::kPython, requested).options.has_value());
}

// NOLINTNEXTLINE
TEST(sandbox_registry, config_overrides_tighten_and_replace) {
    sandbar::config::Config config;
    sandbar::config::SandboxOverride python;
    python.interpreter = "/opt/python/bin/python3";
    python.allowed_packages = std::vector<std::string>{"math"};
    python.max_timeout_ms = 5000;
    config.sandboxes["python"] = python;
    config.sandboxes["cobol"] = sandbar::config::SandboxOverride{};

    const auto registry = SandboxRegistry::FromConfig(config);
    const auto& descriptor = registry->Get(Language::kPython);
    EXPECT_EQ(descriptor.interpreter, "/opt/python/bin/python3");
    EXPECT_EQ(descriptor.maximums.timeout_ms, 5000);
    EXPECT_EQ(descriptor.defaults.timeout_ms, 5000);
    EXPECT_TRUE(registry->IsPackageAllowed(Language::kPython, "math"));
    EXPECT_FALSE(registry->IsPackageAllowed(Language::kPython, "numpy"));
    EXPECT_EQ(registry->All().size(), 3u);
}
