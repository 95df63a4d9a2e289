#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sandbar::validator {

enum class Layer {
    kCharacter,
    kPattern,
    kImport,
    kBypass,
    kStructure,
    kSignature
};

enum class ViolationKind {
    // character layer
    kEmptySource,
    kSourceTooLarge,
    kNullByte,
    kControlCharacter,
    kInvalidEncoding,
    kInvisibleCharacter,
    kUnusualCodePoint,
    kWhitespacePadding,
    // pattern layer
    kProcessAccess,
    kFilesystemAccess,
    kNetworkAccess,
    kDynamicEvaluation,
    kShellInjection,
    kPrivilegeEscalation,
    kRuntimeGlobals,
    kIntrospection,
    // import layer
    kDisallowedImport,
    kRelativeImport,
    kWildcardImport,
    kDynamicImport,
    kSourcedScript,
    // bypass layer
    kCharCodeReconstruction,
    kEscapeSequence,
    kEncodedLiteral,
    kDecoderCall,
    kStringAssembly,
    // structure layer
    kReflectiveAttribute,
    kComputedAttribute,
    kReflectiveBuiltin,
    kInterpreterInternal,
    kIndirectExpansion,
    // signature layer
    kKnownExploit
};

const char* ToString(Layer layer);
const char* ToString(ViolationKind kind);

struct Violation {
    Layer layer = Layer::kCharacter;
    ViolationKind kind = ViolationKind::kEmptySource;
    std::string pattern;
    std::string excerpt;
    int line = 0;
    std::size_t offset = 0;
};

struct ValidationVerdict {
    bool accepted = true;
    std::vector<Violation> violations;
};

constexpr std::size_t kMaxExcerptBytes = 48;

// Printable ASCII slice of the source; never the whole payload.
std::string MakeExcerpt(std::string_view source, std::size_t offset, std::size_t length);
std::string SanitizeExcerpt(std::string_view text);
int LineAt(std::string_view source, std::size_t offset);

Violation MakeViolation(Layer layer,
                        ViolationKind kind,
                        std::string pattern,
                        std::string_view source,
                        std::size_t offset,
                        std::size_t length);

}  // namespace sandbar::validator
