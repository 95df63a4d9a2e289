#pragma once

#include <memory>
#include <string_view>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "validator/signature_set.hpp"
#include "validator/violation.hpp"

namespace sandbar::validator {

// Runs the character, pattern, import, bypass, structure and signature layers
// in that order. Stateless after construction and safe to share across threads.
class StaticValidator {
public:
    StaticValidator(std::shared_ptr<const sandbox::SandboxRegistry> registry,
                    config::ValidatorConfig config);

    ValidationVerdict Validate(std::string_view source_code, sandbox::Language language) const;

private:
    std::shared_ptr<const sandbox::SandboxRegistry> registry_;
    config::ValidatorConfig config_;
    SignatureSet signatures_;
};

}  // namespace sandbar::validator
