#pragma once

#include <string_view>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "validator/signature_set.hpp"
#include "validator/source_scanner.hpp"
#include "validator/violation.hpp"

namespace sandbar::validator {

// One submission as every layer sees it; tokens are scanned once up front.
struct SourceUnit {
    std::string_view text;
    sandbox::Language language = sandbox::Language::kPython;
    const sandbox::SandboxDescriptor* sandbox = nullptr;
    std::vector<Token> tokens;
};

struct DenyPattern {
    ViolationKind kind;
    std::string_view needle;
    bool whole_word = false;
    bool case_sensitive = false;
};

const std::vector<DenyPattern>& DenyPatterns(sandbox::Language language);

std::vector<Violation> CheckCharacters(const SourceUnit& unit, const config::ValidatorConfig& config);
std::vector<Violation> CheckPatterns(const SourceUnit& unit);
std::vector<Violation> CheckImports(const SourceUnit& unit);
std::vector<Violation> CheckBypasses(const SourceUnit& unit);
// Not a full parse: matches a sliding window over the token stream (attribute
// access, subscripts with constant strings folded from adjacent literals,
// calls to reflective builtins). Constructs that only a real parser would
// resolve, such as values computed at run time, can pass this layer.
std::vector<Violation> CheckStructure(const SourceUnit& unit);
std::vector<Violation> CheckSignatures(const SourceUnit& unit, const SignatureSet& signatures);

}  // namespace sandbar::validator
