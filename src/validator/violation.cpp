#include "validator/violation.hpp"

#include <algorithm>

namespace sandbar::validator {

const char* ToString(Layer layer) {
    switch (layer) {
        case Layer::kCharacter: return "character";
        case Layer::kPattern: return "pattern";
        case Layer::kImport: return "import";
        case Layer::kBypass: return "bypass";
        case Layer::kStructure: return "structure";
        case Layer::kSignature: return "signature";
    }
    return "unknown";
}

const char* ToString(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::kEmptySource: return "empty_source";
        case ViolationKind::kSourceTooLarge: return "source_too_large";
        case ViolationKind::kNullByte: return "null_byte";
        case ViolationKind::kControlCharacter: return "control_character";
        case ViolationKind::kInvalidEncoding: return "invalid_encoding";
        case ViolationKind::kInvisibleCharacter: return "invisible_character";
        case ViolationKind::kUnusualCodePoint: return "unusual_code_point";
        case ViolationKind::kWhitespacePadding: return "whitespace_padding";
        case ViolationKind::kProcessAccess: return "process_access";
        case ViolationKind::kFilesystemAccess: return "filesystem_access";
        case ViolationKind::kNetworkAccess: return "network_access";
        case ViolationKind::kDynamicEvaluation: return "dynamic_evaluation";
        case ViolationKind::kShellInjection: return "shell_injection";
        case ViolationKind::kPrivilegeEscalation: return "privilege_escalation";
        case ViolationKind::kRuntimeGlobals: return "runtime_globals";
        case ViolationKind::kIntrospection: return "introspection";
        case ViolationKind::kDisallowedImport: return "disallowed_import";
        case ViolationKind::kRelativeImport: return "relative_import";
        case ViolationKind::kWildcardImport: return "wildcard_import";
        case ViolationKind::kDynamicImport: return "dynamic_import";
        case ViolationKind::kSourcedScript: return "sourced_script";
        case ViolationKind::kCharCodeReconstruction: return "char_code_reconstruction";
        case ViolationKind::kEscapeSequence: return "escape_sequence";
        case ViolationKind::kEncodedLiteral: return "encoded_literal";
        case ViolationKind::kDecoderCall: return "decoder_call";
        case ViolationKind::kStringAssembly: return "string_assembly";
        case ViolationKind::kReflectiveAttribute: return "reflective_attribute";
        case ViolationKind::kComputedAttribute: return "computed_attribute";
        case ViolationKind::kReflectiveBuiltin: return "reflective_builtin";
        case ViolationKind::kInterpreterInternal: return "interpreter_internal";
        case ViolationKind::kIndirectExpansion: return "indirect_expansion";
        case ViolationKind::kKnownExploit: return "known_exploit";
    }
    return "unknown";
}

std::string SanitizeExcerpt(std::string_view text) {
    std::string excerpt;
    const auto length = std::min(text.size(), kMaxExcerptBytes);
    excerpt.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        excerpt.push_back(c >= 0x20 && c < 0x7f ? static_cast<char>(c) : '?');
    }
    return excerpt;
}

std::string MakeExcerpt(std::string_view source, std::size_t offset, std::size_t length) {
    if (offset >= source.size()) {
        return {};
    }
    return SanitizeExcerpt(source.substr(offset, std::max<std::size_t>(length, 1)));
}

int LineAt(std::string_view source, std::size_t offset) {
    const auto end = std::min(offset, source.size());
    return 1 + static_cast<int>(std::count(source.begin(), source.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
}

Violation MakeViolation(Layer layer,
                        ViolationKind kind,
                        std::string pattern,
                        std::string_view source,
                        std::size_t offset,
                        std::size_t length) {
    Violation violation{};
    violation.layer = layer;
    violation.kind = kind;
    violation.pattern = std::move(pattern);
    violation.excerpt = MakeExcerpt(source, offset, length);
    violation.line = LineAt(source, offset);
    violation.offset = offset;
    return violation;
}

}  // namespace sandbar::validator
