#include "validator/static_validator.hpp"

#include "validator/validation_layers.hpp"

namespace sandbar::validator {
namespace {

void Append(std::vector<Violation>& target, std::vector<Violation> found) {
    target.insert(target.end(),
                  std::make_move_iterator(found.begin()),
                  std::make_move_iterator(found.end()));
}

}  // namespace

StaticValidator::StaticValidator(std::shared_ptr<const sandbox::SandboxRegistry> registry,
                                 config::ValidatorConfig config)
    : registry_(std::move(registry)),
      config_(std::move(config)),
      signatures_(config_.known_signatures) {}

ValidationVerdict StaticValidator::Validate(std::string_view source_code, sandbox::Language language) const {
    ValidationVerdict verdict{};
    SourceUnit unit{};
    unit.text = source_code;
    unit.language = language;
    unit.sandbox = registry_ ? registry_->Find(language) : nullptr;

    verdict.violations = CheckCharacters(unit, config_);
    // Oversized or empty input is not worth tokenizing.
    const bool fatal = !verdict.violations.empty() &&
                       (verdict.violations.front().kind == ViolationKind::kEmptySource ||
                        verdict.violations.front().kind == ViolationKind::kSourceTooLarge);
    if (!fatal) {
        unit.tokens = ScanSource(source_code, language);
        Append(verdict.violations, CheckPatterns(unit));
        Append(verdict.violations, CheckImports(unit));
        Append(verdict.violations, CheckBypasses(unit));
        Append(verdict.violations, CheckStructure(unit));
        Append(verdict.violations, CheckSignatures(unit, signatures_));
    }
    verdict.accepted = verdict.violations.empty();
    return verdict;
}

}  // namespace sandbar::validator
