#include "validator/validation_layers.hpp"

namespace sandbar::validator {
namespace {

void CheckCandidate(const SourceUnit& unit,
                    const SignatureSet& signatures,
                    std::string_view candidate,
                    std::size_t offset,
                    std::vector<Violation>& violations) {
    if (candidate.empty()) {
        return;
    }
    if (signatures.Contains(Sha256Hex(candidate)) || signatures.Contains(Sha256Hex(CompactForm(candidate)))) {
        violations.push_back(MakeViolation(
            Layer::kSignature, ViolationKind::kKnownExploit, "known exploit signature",
            unit.text, offset, candidate.size()));
    }
}

}  // namespace

std::vector<Violation> CheckSignatures(const SourceUnit& unit, const SignatureSet& signatures) {
    std::vector<Violation> violations;
    CheckCandidate(unit, signatures, unit.text, 0, violations);
    if (!violations.empty()) {
        return violations;
    }
    const auto text = unit.text;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        if (end > start && end - start < text.size()) {
            CheckCandidate(unit, signatures, text.substr(start, end - start), start, violations);
        }
        start = end + 1;
    }
    return violations;
}

}  // namespace sandbar::validator
